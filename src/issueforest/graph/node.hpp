/**
 * @file node.hpp
 */
#pragma once
#include "issueforest/common/common.hpp"
#include "issueforest/common/forest_enums.hpp"
#include "issueforest/common/issue_record.hpp"
#include "issueforest/common/timestamp.hpp"

namespace issueforest
{

/**
 * @brief One issue inside the forest, with its links and computed annotations.
 *
 * @details
 * Nodes live in the `IssueForest` arena and refer to each other by `NodeIdx`.
 * A node reachable from k parents is one arena entry listed in k `children`
 * vectors; it is never copied.
 *
 * @par Edges
 * - `children`, `parents`: parent-child hierarchy. `parents` holds no duplicate
 *   IDs; a node is a root iff `parents` is empty.
 * - `parent`: first entry of `parents`, kept for single-parent consumers.
 * - `blocked_by`, `blocks`: blocker -> blocked. `blocks` is ordered by the
 *   blocked node's creation time.
 * - `related`: symmetric association.
 * - `discovered_from`: provenance, present on the discovering node only.
 *
 * @par Computed state
 * - `is_blocked`: some blocker is not closed.
 * - `has_in_progress`, `has_ready`: the node or a descendant is in progress /
 *   ready.
 * - `sort_priority`, `sort_timestamp`: the most urgent key among the node and
 *   its descendants.
 * - `depth`: length of the last root-to-node path, taking roots and
 *   children in input order. `tree_depth`: longest parent chain above the node.
 *
 * @par Mutability
 * Everything except `expanded` is written once by `ForestBuilder::build()`.
 * `expanded` is changed through `IssueForest::set_expanded()`.
 */
struct Node
{
    IssueRecord issue;
    IssueStatus status = IssueStatus::Unknown;

    std::vector<NodeIdx> children;
    std::vector<NodeIdx> parents;
    std::optional<NodeIdx> parent;

    std::vector<NodeIdx> blocked_by;
    std::vector<NodeIdx> blocks;
    std::vector<NodeIdx> related;
    std::vector<NodeIdx> discovered_from;

    bool is_blocked = false;
    bool expanded = false;
    int depth = 0;
    int tree_depth = 0;
    bool has_in_progress = false;
    bool has_ready = false;

    SortPriority sort_priority = SortPriority::Open;
    Timestamp sort_timestamp{};

    const std::string& id() const noexcept
    {
        return issue.id;
    }

    bool is_root() const noexcept
    {
        return parents.empty();
    }
};

/**
 * @brief Display sort key: priority class, then timestamp.
 */
struct SortKey
{
    SortPriority priority;
    Timestamp timestamp;

    /// True if this key is more urgent than `other`.
    bool precedes(const SortKey& other) const noexcept
    {
        if (priority != other.priority)
        {
            return static_cast<int>(priority) < static_cast<int>(other.priority);
        }
        return timestamp < other.timestamp;
    }
};

/**
 * @brief The key a node has on its own, ignoring descendants.
 *
 * @details
 * - in progress: (InProgress, first parseable of updated_at, created_at)
 * - closed: (Closed, first parseable of closed_at, updated_at, created_at)
 * - open and not blocked: (Ready, created_at)
 * - anything else: (Open, created_at)
 *
 * Missing or malformed timestamps resolve to `distant_future()`.
 */
SortKey node_self_sort_key(const Node& node);

} // namespace issueforest
