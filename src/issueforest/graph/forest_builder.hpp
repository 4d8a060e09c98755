/**
 * @file forest_builder.hpp
 * @brief ForestBuilder turns a flat issue snapshot into an ordered IssueForest.
 */
#pragma once
#include "issueforest/common/common.hpp"
#include "issueforest/common/forest_diagnostics.hpp"
#include "issueforest/common/forest_exceptions.hpp"
#include "issueforest/common/issue_record.hpp"
#include "issueforest/graph/issue_forest.hpp"

namespace issueforest
{

/**
 * @brief Builds an `IssueForest` from a flat collection of issue records.
 *
 * @details
 * `build()` runs a fixed pipeline over a full snapshot. Nothing is carried
 * over from a previous call.
 *
 * @par Pipeline
 * 1. Index records by ID into the arena (input order; later duplicates win).
 * 2. Link typed edges: parent-child (both declaration directions), blocks,
 *    related, discovered-from. Edges to unknown IDs are dropped.
 * 3. Deduplicate every node's parents by ID.
 * 4. Reject any cycle in the parent-child hierarchy.
 * 5. Compute `tree_depth` for all nodes.
 * 6. Attach every node under each of its parents and collect the roots.
 * 7. Sort every `blocks` list by the blocked node's creation time.
 * 8. Propagate in-progress / ready state up from the leaves, once per node.
 * 9. Assign `depth` along the last root-to-node path in input order.
 * 10. Per root: compute sort keys (which also sorts each node's children).
 * 11. Sort the roots.
 *
 * @par Thread Safety
 * - `build()` is const and keeps no state; one builder may serve many threads.
 * - The returned forest is not synchronized.
 */
class ForestBuilder
{
public:
    ForestBuilder() = default;

    /**
     * @brief Build the forest for one snapshot.
     *
     * @param issues The issue records. Empty input yields an empty forest.
     * @return The forest, with roots and children in display order.
     * @throws CyclicDependencyError if the parent-child hierarchy has a cycle.
     */
    IssueForest build(const std::vector<IssueRecord>& issues) const;

    /**
     * @brief Display-order comparator over two nodes.
     *
     * @details
     * Orders by sort priority, then sort timestamp, then issue ID. This is a
     * total order, so sorting with it does not depend on input order.
     */
    static bool display_less(const Node& a, const Node& b) noexcept;

private:
    static void index_issues(IssueForest& forest, const std::vector<IssueRecord>& issues);
    static void link_relationships(IssueForest& forest);
    static void dedup_parents(IssueForest& forest);

    /// Returns the nodes in an order where every parent precedes its children.
    static std::vector<NodeIdx> ensure_acyclic(IssueForest& forest);

    static void compute_tree_depths(IssueForest& forest, const std::vector<NodeIdx>& topo_order);
    static void assemble_forest(IssueForest& forest);
    static void sort_blocks(IssueForest& forest);
    static void compute_states(IssueForest& forest);
    static void compute_depths(IssueForest& forest);
    static void compute_sort_metrics(IssueForest& forest, NodeIdx root, std::vector<char>& done);
    static void sort_display_order(const IssueForest& forest, std::vector<NodeIdx>& indices);
};

} // namespace issueforest
