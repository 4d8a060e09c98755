/**
 * @file node.cpp
 */
#include "issueforest/graph/node.hpp"

namespace issueforest
{

SortKey node_self_sort_key(const Node& node)
{
    const IssueRecord& issue = node.issue;
    switch (node.status)
    {
    case IssueStatus::InProgress:
        return SortKey{SortPriority::InProgress,
                       pick_timestamp({&issue.updated_at, &issue.created_at})};
    case IssueStatus::Closed:
        return SortKey{SortPriority::Closed,
                       pick_timestamp({&issue.closed_at, &issue.updated_at, &issue.created_at})};
    case IssueStatus::Open:
        if (!node.is_blocked)
        {
            return SortKey{SortPriority::Ready, pick_timestamp({&issue.created_at})};
        }
        break;
    default:
        break;
    }
    return SortKey{SortPriority::Open, pick_timestamp({&issue.created_at})};
}

} // namespace issueforest
