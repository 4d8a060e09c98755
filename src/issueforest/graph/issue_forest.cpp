/**
 * @file issue_forest.cpp
 */
#include "issueforest/graph/issue_forest.hpp"

namespace issueforest
{

IssueForest::IssueForest()
    : m_diagnostics(std::make_shared<ForestDiagnostics>())
{
}

void IssueForest::check_index(NodeIdx idx) const
{
    if (idx >= m_nodes.size())
    {
        throw ForestError(
            ForestErrorCode::InvalidNodeIndex,
            "Node index " + std::to_string(idx) + " does not exist (node count " +
                std::to_string(m_nodes.size()) + ")");
    }
}

const Node& IssueForest::node(NodeIdx idx) const
{
    check_index(idx);
    return m_nodes[idx];
}

std::optional<NodeIdx> IssueForest::find(const std::string& id) const noexcept
{
    NodeIdx idx = m_index.find(id);
    if (idx == IssueIndex::npos)
    {
        return std::nullopt;
    }
    return idx;
}

void IssueForest::set_expanded(NodeIdx idx, bool expanded)
{
    check_index(idx);
    m_nodes[idx].expanded = expanded;
}

bool IssueForest::toggle_expanded(NodeIdx idx)
{
    check_index(idx);
    m_nodes[idx].expanded = !m_nodes[idx].expanded;
    return m_nodes[idx].expanded;
}

ForestStats IssueForest::stats() const
{
    ForestStats s;
    for (const Node& n : m_nodes)
    {
        ++s.total;
        if (n.status == IssueStatus::InProgress)
        {
            ++s.in_progress;
        }
        else if (n.status == IssueStatus::Closed)
        {
            ++s.closed;
        }
        else if (n.is_blocked)
        {
            ++s.blocked;
        }
        else
        {
            ++s.ready;
        }
    }
    return s;
}

} // namespace issueforest
