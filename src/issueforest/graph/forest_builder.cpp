/**
 * @file forest_builder.cpp
 */
#include "issueforest/graph/forest_builder.hpp"
#include "issueforest/runtime/logging.hpp"

#include <algorithm>

namespace issueforest
{

namespace
{

bool contains(const std::vector<NodeIdx>& list, NodeIdx idx)
{
    return std::find(list.begin(), list.end(), idx) != list.end();
}

void append_unique(std::vector<NodeIdx>& list, NodeIdx idx)
{
    if (!contains(list, idx))
    {
        list.push_back(idx);
    }
}

} // namespace

// ============================================================================
// Build orchestration
// ============================================================================

IssueForest ForestBuilder::build(const std::vector<IssueRecord>& issues) const
{
    IssueForest forest;
    if (issues.empty())
    {
        return forest;
    }

    index_issues(forest, issues);
    link_relationships(forest);
    dedup_parents(forest);

    auto topo_order = ensure_acyclic(forest);
    compute_tree_depths(forest, topo_order);

    assemble_forest(forest);
    sort_blocks(forest);

    compute_states(forest);
    compute_depths(forest);

    std::vector<char> metrics_done(forest.m_nodes.size(), 0);
    for (NodeIdx root : forest.m_roots)
    {
        compute_sort_metrics(forest, root, metrics_done);
    }
    sort_display_order(forest, forest.m_roots);

    ISSUEFOREST_LOG_DEBUG("forest built",
        {logging::int_field("issues", static_cast<int64_t>(issues.size())),
         logging::int_field("nodes", static_cast<int64_t>(forest.m_nodes.size())),
         logging::int_field("roots", static_cast<int64_t>(forest.m_roots.size())),
         logging::int_field("warnings", static_cast<int64_t>(forest.m_diagnostics->warnings().size()))});
    return forest;
}

// ============================================================================
// Indexing and linking
// ============================================================================

void ForestBuilder::index_issues(IssueForest& forest, const std::vector<IssueRecord>& issues)
{
    forest.m_nodes.reserve(issues.size());
    for (const auto& record : issues)
    {
        if (record.id.empty())
        {
            forest.m_diagnostics->add_warning(
                DiagnosticCategory::MissingIssueId,
                "Skipping issue record without an ID (title \"" + record.title + "\")", {});
            continue;
        }

        NodeIdx idx = forest.m_index.insert(record.id);
        if (idx < forest.m_nodes.size())
        {
            forest.m_diagnostics->add_warning(
                DiagnosticCategory::DuplicateIssueId,
                "Issue " + record.id + " appears more than once; keeping the last record",
                {record.id});
            forest.m_nodes[idx].issue = record;
            forest.m_nodes[idx].status = parse_issue_status(record.status);
            continue;
        }

        Node node;
        node.issue = record;
        node.status = parse_issue_status(record.status);
        forest.m_nodes.push_back(std::move(node));
    }
}

void ForestBuilder::link_relationships(IssueForest& forest)
{
    auto& nodes = forest.m_nodes;
    const auto& index = forest.m_index;
    auto& diagnostics = *forest.m_diagnostics;

    for (NodeIdx idx = 0; idx < nodes.size(); ++idx)
    {
        for (const auto& dep : nodes[idx].issue.dependencies)
        {
            const RelationshipType type = parse_relationship_type(dep.type);
            if (type == RelationshipType::Unknown)
            {
                diagnostics.add_warning(
                    DiagnosticCategory::UnknownRelationship,
                    "Issue " + nodes[idx].id() + " has dependency of unknown type \"" +
                        dep.type + "\" on " + dep.target_id,
                    {nodes[idx].id(), dep.target_id});
                continue;
            }

            NodeIdx target = index.find(dep.target_id);
            if (target == IssueIndex::npos)
            {
                diagnostics.add_warning(
                    DiagnosticCategory::DanglingReference,
                    "Issue " + nodes[idx].id() + " references missing issue " + dep.target_id +
                        " (" + to_string(type) + ")",
                    {nodes[idx].id(), dep.target_id});
                continue;
            }

            switch (type)
            {
            case RelationshipType::ParentChild:
                nodes[idx].parents.push_back(target);
                break;
            case RelationshipType::Blocks:
                append_unique(nodes[idx].blocked_by, target);
                if (!is_terminal(nodes[target].status))
                {
                    nodes[idx].is_blocked = true;
                }
                append_unique(nodes[target].blocks, idx);
                break;
            case RelationshipType::Related:
                append_unique(nodes[idx].related, target);
                append_unique(nodes[target].related, idx);
                break;
            case RelationshipType::DiscoveredFrom:
                append_unique(nodes[idx].discovered_from, target);
                break;
            case RelationshipType::Unknown:
                break;
            }
        }

        // Reverse declarations: this issue names its children.
        for (const auto& dep : nodes[idx].issue.dependents)
        {
            if (parse_relationship_type(dep.type) != RelationshipType::ParentChild)
            {
                continue;
            }
            NodeIdx child = index.find(dep.id);
            if (child == IssueIndex::npos)
            {
                diagnostics.add_warning(
                    DiagnosticCategory::DanglingReference,
                    "Issue " + nodes[idx].id() + " lists missing child " + dep.id,
                    {nodes[idx].id(), dep.id});
                continue;
            }
            nodes[child].parents.push_back(idx);
        }
    }
}

void ForestBuilder::dedup_parents(IssueForest& forest)
{
    for (auto& node : forest.m_nodes)
    {
        if (node.parents.size() <= 1)
        {
            continue;
        }
        // Arena indices are unique per issue ID, so index identity is ID identity.
        std::unordered_set<NodeIdx> seen;
        std::vector<NodeIdx> unique;
        unique.reserve(node.parents.size());
        for (NodeIdx p : node.parents)
        {
            if (seen.insert(p).second)
            {
                unique.push_back(p);
            }
        }
        node.parents = std::move(unique);
    }
}

// ============================================================================
// Validation and depth
// ============================================================================

std::vector<NodeIdx> ForestBuilder::ensure_acyclic(IssueForest& forest)
{
    const auto& nodes = forest.m_nodes;
    const size_t count = nodes.size();

    std::vector<char> visited(count, 0);
    std::vector<char> on_stack(count, 0);
    std::vector<NodeIdx> finish_order;
    finish_order.reserve(count);

    struct Frame
    {
        NodeIdx idx;
        size_t next_parent;
    };

    // Iterative DFS over parent edges
    std::vector<Frame> stack;
    for (NodeIdx start = 0; start < count; ++start)
    {
        if (visited[start])
        {
            continue;
        }
        on_stack[start] = 1;
        stack.push_back(Frame{start, 0});

        while (!stack.empty())
        {
            Frame& top = stack.back();
            const Node& node = nodes[top.idx];
            if (top.next_parent < node.parents.size())
            {
                NodeIdx p = node.parents[top.next_parent++];
                if (on_stack[p])
                {
                    // Path runs from the re-entered node down the stack and back to it.
                    std::vector<std::string> path;
                    auto reentry = std::find_if(stack.begin(), stack.end(),
                                                [p](const Frame& f) { return f.idx == p; });
                    for (auto it = reentry; it != stack.end(); ++it)
                    {
                        path.push_back(nodes[it->idx].id());
                    }
                    path.push_back(nodes[p].id());

                    DiagnosticItem item;
                    item.severity = DiagnosticSeverity::Error;
                    item.category = DiagnosticCategory::Cycle;
                    item.message = "Cycle detected in parent-child hierarchy";
                    item.involved_issues = path;
                    forest.m_diagnostics->add(std::move(item));

                    CyclicDependencyError error(std::move(path), forest.m_diagnostics);
                    ISSUEFOREST_LOG_WARN("forest build rejected",
                        {logging::string_field("error", error.what())});
                    throw error;
                }
                if (!visited[p])
                {
                    on_stack[p] = 1;
                    stack.push_back(Frame{p, 0});
                }
            }
            else
            {
                on_stack[top.idx] = 0;
                visited[top.idx] = 1;
                finish_order.push_back(top.idx);
                stack.pop_back();
            }
        }
    }
    return finish_order;
}

void ForestBuilder::compute_tree_depths(IssueForest& forest, const std::vector<NodeIdx>& topo_order)
{
    auto& nodes = forest.m_nodes;
    for (NodeIdx idx : topo_order)
    {
        Node& node = nodes[idx];
        if (node.parents.empty())
        {
            node.tree_depth = 0;
            continue;
        }
        int max_depth = 0;
        for (NodeIdx p : node.parents)
        {
            max_depth = std::max(max_depth, nodes[p].tree_depth);
        }
        node.tree_depth = max_depth + 1;
    }
}

// ============================================================================
// Assembly
// ============================================================================

void ForestBuilder::assemble_forest(IssueForest& forest)
{
    auto& nodes = forest.m_nodes;
    for (NodeIdx idx = 0; idx < nodes.size(); ++idx)
    {
        Node& node = nodes[idx];
        if (node.parents.empty())
        {
            forest.m_roots.push_back(idx);
            continue;
        }

        // Shared node: listed under every parent, stored once.
        for (NodeIdx p : node.parents)
        {
            append_unique(nodes[p].children, idx);
        }
        node.parent = node.parents.front();
    }
}

void ForestBuilder::sort_blocks(IssueForest& forest)
{
    auto& nodes = forest.m_nodes;
    std::vector<Timestamp> created;
    created.reserve(nodes.size());
    for (const auto& node : nodes)
    {
        created.push_back(pick_timestamp({&node.issue.created_at}));
    }

    for (auto& node : nodes)
    {
        std::stable_sort(node.blocks.begin(), node.blocks.end(),
                         [&](NodeIdx a, NodeIdx b) {
                             if (created[a] != created[b])
                             {
                                 return created[a] < created[b];
                             }
                             return nodes[a].id() < nodes[b].id();
                         });
    }
}

// ============================================================================
// Propagation
// ============================================================================

void ForestBuilder::compute_states(IssueForest& forest)
{
    auto& nodes = forest.m_nodes;
    std::vector<char> done(nodes.size(), 0);

    struct Frame
    {
        NodeIdx idx;
        size_t next_child;
    };

    // Flags depend only on descendants, so each node is finished once.
    std::vector<Frame> stack;
    for (NodeIdx root : forest.m_roots)
    {
        stack.push_back(Frame{root, 0});
        while (!stack.empty())
        {
            Frame& top = stack.back();
            const Node& node = nodes[top.idx];
            if (top.next_child < node.children.size())
            {
                NodeIdx child = node.children[top.next_child++];
                if (!done[child])
                {
                    stack.push_back(Frame{child, 0});
                }
                continue;
            }

            Node& finished = nodes[top.idx];
            finished.has_in_progress = finished.status == IssueStatus::InProgress;
            finished.has_ready = finished.status == IssueStatus::Open && !finished.is_blocked;
            for (NodeIdx child : finished.children)
            {
                if (nodes[child].has_in_progress)
                {
                    finished.has_in_progress = true;
                    finished.expanded = true;
                }
                if (nodes[child].has_ready)
                {
                    finished.has_ready = true;
                }
            }
            done[top.idx] = 1;
            stack.pop_back();
        }

        Node& root_node = nodes[root];
        if (root_node.has_in_progress)
        {
            root_node.expanded = true;
        }
    }
}

void ForestBuilder::compute_depths(IssueForest& forest)
{
    auto& nodes = forest.m_nodes;
    std::vector<char> visited(nodes.size(), 0);

    struct Frame
    {
        NodeIdx idx;
        size_t remaining;
    };

    // A node's depth is the one on the last root-to-node path of a forward
    // walk (roots and children in order). That path is the first one reached
    // by the mirrored walk, and a visited node's subtree is already complete,
    // so each node is entered once.
    std::vector<Frame> stack;
    const auto& roots = forest.m_roots;
    for (auto it = roots.rbegin(); it != roots.rend(); ++it)
    {
        nodes[*it].depth = 0;
        visited[*it] = 1;
        stack.push_back(Frame{*it, nodes[*it].children.size()});
        while (!stack.empty())
        {
            Frame& top = stack.back();
            if (top.remaining == 0)
            {
                stack.pop_back();
                continue;
            }
            const Node& node = nodes[top.idx];
            NodeIdx child = node.children[--top.remaining];
            if (visited[child])
            {
                continue;
            }
            visited[child] = 1;
            nodes[child].depth = node.depth + 1;
            stack.push_back(Frame{child, nodes[child].children.size()});
        }
    }
}

void ForestBuilder::compute_sort_metrics(IssueForest& forest, NodeIdx root, std::vector<char>& done)
{
    auto& nodes = forest.m_nodes;
    if (done[root])
    {
        return;
    }

    struct Frame
    {
        NodeIdx idx;
        size_t next_child;
        SortKey key;
    };

    // A node's key depends only on its descendants, so shared nodes are computed once.
    auto enter = [&](NodeIdx idx) {
        SortKey own = node_self_sort_key(nodes[idx]);
        if (own.timestamp == distant_future())
        {
            forest.m_diagnostics->add_warning(
                DiagnosticCategory::UnparseableTimestamp,
                "Issue " + nodes[idx].id() + " has no parseable timestamp; sorting it last in its class",
                {nodes[idx].id()});
        }
        return Frame{idx, 0, own};
    };

    std::vector<Frame> stack{enter(root)};
    while (!stack.empty())
    {
        Frame& top = stack.back();
        const Node& node = nodes[top.idx];
        if (top.next_child < node.children.size())
        {
            NodeIdx child = node.children[top.next_child++];
            if (done[child])
            {
                SortKey child_key{nodes[child].sort_priority, nodes[child].sort_timestamp};
                if (child_key.precedes(top.key))
                {
                    top.key = child_key;
                }
                continue;
            }
            stack.push_back(enter(child));
            continue;
        }

        Node& finished = nodes[top.idx];
        finished.sort_priority = top.key.priority;
        finished.sort_timestamp = top.key.timestamp;
        sort_display_order(forest, finished.children);
        done[top.idx] = 1;

        SortKey finished_key = top.key;
        stack.pop_back();
        if (!stack.empty() && finished_key.precedes(stack.back().key))
        {
            stack.back().key = finished_key;
        }
    }
}

// ============================================================================
// Ordering
// ============================================================================

bool ForestBuilder::display_less(const Node& a, const Node& b) noexcept
{
    if (a.sort_priority != b.sort_priority)
    {
        return static_cast<int>(a.sort_priority) < static_cast<int>(b.sort_priority);
    }
    if (a.sort_timestamp != b.sort_timestamp)
    {
        return a.sort_timestamp < b.sort_timestamp;
    }
    return a.id() < b.id();
}

void ForestBuilder::sort_display_order(const IssueForest& forest, std::vector<NodeIdx>& indices)
{
    const auto& nodes = forest.m_nodes;
    std::stable_sort(indices.begin(), indices.end(),
                     [&nodes](NodeIdx a, NodeIdx b) { return display_less(nodes[a], nodes[b]); });
}

} // namespace issueforest
