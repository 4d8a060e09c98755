/**
 * @file issue_forest.hpp
 */
#pragma once
#include "issueforest/common/common.hpp"
#include "issueforest/common/forest_diagnostics.hpp"
#include "issueforest/common/forest_exceptions.hpp"
#include "issueforest/common/issue_index.hpp"
#include "issueforest/graph/node.hpp"

namespace issueforest
{

/**
 * @brief Per-status counts over the distinct nodes of a forest.
 */
struct ForestStats
{
    size_t total = 0;
    size_t in_progress = 0;
    size_t ready = 0;
    size_t blocked = 0;
    size_t closed = 0;
};

/**
 * @brief An ordered, multi-rooted forest of issues.
 *
 * @details
 * `IssueForest` owns every `Node` in a single arena. Nodes are addressed by
 * `NodeIdx`, which follows the order in which issue IDs first appeared in the
 * builder's input. The forest is produced by `ForestBuilder::build()`; a
 * default-constructed forest is empty.
 *
 * @par Display order
 * `roots()` and every node's `children` are already sorted for display. A
 * renderer walks `roots()` and recurses through `children`; a node with k
 * parents is encountered k times.
 *
 * @par Mutability
 * Structure and computed state are read-only. The expand flag is the only
 * thing a caller may change, through `set_expanded()` or `toggle_expanded()`.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads are safe if nobody toggles `expanded` at the same time.
 */
class IssueForest
{
public:
    IssueForest();

    size_t node_count() const noexcept
    {
        return m_nodes.size();
    }

    bool empty() const noexcept
    {
        return m_nodes.empty();
    }

    /**
     * @brief All nodes in arena order.
     */
    const std::vector<Node>& nodes() const noexcept
    {
        return m_nodes;
    }

    /**
     * @brief Access a node by arena index.
     * @throw ForestError with `InvalidNodeIndex` if `idx >= node_count()`.
     */
    const Node& node(NodeIdx idx) const;

    /**
     * @brief Root nodes in display order.
     */
    const std::vector<NodeIdx>& roots() const noexcept
    {
        return m_roots;
    }

    /**
     * @brief Look up a node by issue ID.
     */
    std::optional<NodeIdx> find(const std::string& id) const noexcept;

    /**
     * @brief Set the expand flag of one node.
     * @throw ForestError with `InvalidNodeIndex` if `idx >= node_count()`.
     */
    void set_expanded(NodeIdx idx, bool expanded);

    /**
     * @brief Flip the expand flag of one node.
     * @return The new value of the flag.
     * @throw ForestError with `InvalidNodeIndex` if `idx >= node_count()`.
     */
    bool toggle_expanded(NodeIdx idx);

    /**
     * @brief Count distinct nodes by status.
     *
     * @details
     * Each node is counted once regardless of how many parents it has, in the
     * first matching bucket of: in progress, closed, blocked, ready.
     */
    ForestStats stats() const;

    /**
     * @brief Warnings recorded while building this forest.
     */
    const ForestDiagnostics& diagnostics() const noexcept
    {
        return *m_diagnostics;
    }

    // Allow ForestBuilder to populate the arena
    friend class ForestBuilder;

private:
    void check_index(NodeIdx idx) const;

    std::vector<Node> m_nodes;
    IssueIndex m_index;
    std::vector<NodeIdx> m_roots;
    std::shared_ptr<ForestDiagnostics> m_diagnostics;
};

} // namespace issueforest
