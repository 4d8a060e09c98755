/**
 * @file forest_sort_tests.cpp
 * Unit tests for sort keys and display ordering in issueforest::ForestBuilder
 */
#include <gtest/gtest.h>
#include "issueforest/graph/forest_builder.hpp"
#include "issue_fixtures.hpp"

#include <string>
#include <vector>

using namespace issueforest;
using namespace issueforest::fixtures;

namespace
{

Timestamp ts(const std::string& text)
{
    auto parsed = parse_rfc3339(text);
    EXPECT_TRUE(parsed.has_value()) << text;
    return parsed.value_or(distant_future());
}

Node bare_node(const std::string& status, bool blocked)
{
    Node node;
    node.issue.id = "ab-test";
    node.issue.status = status;
    node.issue.created_at = "2024-01-01T00:00:00Z";
    node.issue.updated_at = "2024-01-05T00:00:00Z";
    node.status = parse_issue_status(status);
    node.is_blocked = blocked;
    return node;
}

} // namespace

// ============================================================================
// Self sort key
// ============================================================================

TEST(ForestSortTests, SelfKey_PriorityClassByStatus)
{
    struct Case
    {
        const char* status;
        bool blocked;
        SortPriority expected;
    };
    const Case cases[] = {
        {"in_progress", false, SortPriority::InProgress},
        {"open", false, SortPriority::Ready},
        {"open", true, SortPriority::Open},
        {"blocked", false, SortPriority::Open},
        {"deferred", false, SortPriority::Open},
        {"closed", false, SortPriority::Closed},
    };
    for (const auto& c : cases)
    {
        EXPECT_EQ(node_self_sort_key(bare_node(c.status, c.blocked)).priority, c.expected)
            << c.status << " blocked=" << c.blocked;
    }
}

TEST(ForestSortTests, SelfKey_InProgressUsesUpdatedAt)
{
    Node node = bare_node("in_progress", false);
    EXPECT_EQ(node_self_sort_key(node).timestamp, ts("2024-01-05T00:00:00Z"));

    node.issue.updated_at.clear();
    EXPECT_EQ(node_self_sort_key(node).timestamp, ts("2024-01-01T00:00:00Z"));
}

TEST(ForestSortTests, SelfKey_ClosedPrefersClosedAt)
{
    Node node = bare_node("closed", false);
    node.issue.closed_at = "2024-01-09T00:00:00Z";
    EXPECT_EQ(node_self_sort_key(node).timestamp, ts("2024-01-09T00:00:00Z"));

    node.issue.closed_at = "not a date";
    EXPECT_EQ(node_self_sort_key(node).timestamp, ts("2024-01-05T00:00:00Z"));

    node.issue.updated_at.clear();
    EXPECT_EQ(node_self_sort_key(node).timestamp, ts("2024-01-01T00:00:00Z"));
}

TEST(ForestSortTests, SelfKey_OpenUsesCreatedAt)
{
    EXPECT_EQ(node_self_sort_key(bare_node("open", false)).timestamp, ts("2024-01-01T00:00:00Z"));
    EXPECT_EQ(node_self_sort_key(bare_node("open", true)).timestamp, ts("2024-01-01T00:00:00Z"));
}

TEST(ForestSortTests, SelfKey_MissingTimestampIsDistantFuture)
{
    Node node = bare_node("open", false);
    node.issue.created_at.clear();
    EXPECT_EQ(node_self_sort_key(node).timestamp, distant_future());
}

TEST(ForestSortTests, SortKey_PrecedesComparesPriorityFirst)
{
    SortKey urgent{SortPriority::InProgress, ts("2024-06-01T00:00:00Z")};
    SortKey older{SortPriority::Ready, ts("2020-01-01T00:00:00Z")};
    SortKey newer{SortPriority::Ready, ts("2021-01-01T00:00:00Z")};

    EXPECT_TRUE(urgent.precedes(older));
    EXPECT_FALSE(older.precedes(urgent));
    EXPECT_TRUE(older.precedes(newer));
    EXPECT_FALSE(older.precedes(older));
}

// ============================================================================
// Aggregation over descendants
// ============================================================================

TEST(ForestSortTests, Metrics_InProgressDescendantCascades)
{
    auto parent = make_issue("ab-010", "open", "2024-01-01T00:00:00Z");
    auto child = make_issue("ab-020", "in_progress", "2024-01-01T12:00:00Z");
    child.updated_at = "2024-01-02T00:00:00Z";
    add_parent(child, "ab-010");

    IssueForest forest = ForestBuilder().build({parent, child});

    const Node& p = node_by_id(forest, "ab-010");
    const Node& c = node_by_id(forest, "ab-020");
    EXPECT_EQ(p.sort_priority, SortPriority::InProgress);
    EXPECT_EQ(p.sort_timestamp, c.sort_timestamp);
    EXPECT_EQ(c.sort_timestamp, ts("2024-01-02T00:00:00Z"));
}

TEST(ForestSortTests, Metrics_ClosedParentTakesReadyChildKey)
{
    auto parent = make_issue("ab-1", "closed", "2024-01-01T00:00:00Z");
    parent.closed_at = "2024-01-02T00:00:00Z";
    auto child = make_issue("ab-2", "open", "2024-03-01T00:00:00Z");
    add_parent(child, "ab-1");

    IssueForest forest = ForestBuilder().build({parent, child});

    const Node& p = node_by_id(forest, "ab-1");
    EXPECT_EQ(p.sort_priority, SortPriority::Ready);
    EXPECT_EQ(p.sort_timestamp, ts("2024-03-01T00:00:00Z"));
}

TEST(ForestSortTests, Metrics_EarliestTimestampWithinClassWins)
{
    auto parent = make_issue("ab-1", "open", "2024-05-01T00:00:00Z");
    auto child = make_issue("ab-2", "open", "2024-02-01T00:00:00Z");
    add_parent(child, "ab-1");
    auto grandchild = make_issue("ab-3", "open", "2024-01-01T00:00:00Z");
    add_parent(grandchild, "ab-2");

    IssueForest forest = ForestBuilder().build({parent, child, grandchild});

    EXPECT_EQ(node_by_id(forest, "ab-1").sort_timestamp, ts("2024-01-01T00:00:00Z"));
    EXPECT_EQ(node_by_id(forest, "ab-2").sort_timestamp, ts("2024-01-01T00:00:00Z"));
}

TEST(ForestSortTests, Metrics_SharedNodeCountsForEveryParent)
{
    auto a = make_issue("ab-1", "open", "2024-01-01T00:00:00Z");
    auto b = make_issue("ab-2", "closed", "2024-01-02T00:00:00Z");
    auto shared = make_issue("ab-3", "in_progress", "2024-01-03T00:00:00Z");
    add_parent(shared, "ab-1");
    add_parent(shared, "ab-2");

    IssueForest forest = ForestBuilder().build({a, b, shared});

    EXPECT_EQ(node_by_id(forest, "ab-1").sort_priority, SortPriority::InProgress);
    EXPECT_EQ(node_by_id(forest, "ab-2").sort_priority, SortPriority::InProgress);
    EXPECT_EQ(node_by_id(forest, "ab-1").sort_timestamp, node_by_id(forest, "ab-2").sort_timestamp);
}

// ============================================================================
// Display order
// ============================================================================

TEST(ForestSortTests, Roots_SortedByCascadingPriority)
{
    auto active = make_issue("ab-201", "open", "2024-01-01T00:00:00Z");
    add_child(active, "ab-202");
    auto child = make_issue("ab-202", "in_progress", "2024-01-02T00:00:00Z");
    child.updated_at = "2024-01-03T00:00:00Z";
    add_parent(child, "ab-201");
    auto ready = make_issue("ab-203", "open", "2023-12-01T00:00:00Z");
    auto closed = make_issue("ab-204", "closed", "2024-01-10T00:00:00Z");
    closed.closed_at = "2024-01-11T00:00:00Z";

    IssueForest forest = ForestBuilder().build({closed, ready, child, active});

    EXPECT_EQ(root_ids(forest), (std::vector<std::string>{"ab-201", "ab-203", "ab-204"}));
}

TEST(ForestSortTests, Children_OldestReadyFirst)
{
    auto parent = make_issue("ab-301", "open", "2024-01-01T00:00:00Z");
    add_child(parent, "ab-303");
    add_child(parent, "ab-302");
    auto old_child = make_issue("ab-302", "open", "2023-12-01T00:00:00Z");
    add_parent(old_child, "ab-301");
    auto new_child = make_issue("ab-303", "open", "2024-02-01T00:00:00Z");
    add_parent(new_child, "ab-301");

    IssueForest forest = ForestBuilder().build({parent, new_child, old_child});

    EXPECT_EQ(ids_of(forest, node_by_id(forest, "ab-301").children),
              (std::vector<std::string>{"ab-302", "ab-303"}));
}

TEST(ForestSortTests, Children_ReadyBeforeBlocked)
{
    auto parent = make_issue("ab-100", "open", "2024-01-01T00:00:00Z");
    auto blocked = make_issue("ab-103", "open", "2024-01-15T00:00:00Z");
    add_parent(blocked, "ab-100");
    add_blocker(blocked, "ab-900");
    auto ready_new = make_issue("ab-102", "open", "2024-02-01T00:00:00Z");
    add_parent(ready_new, "ab-100");
    auto ready_old = make_issue("ab-101", "open", "2024-01-01T00:00:00Z");
    add_parent(ready_old, "ab-100");
    auto blocker = make_issue("ab-900", "open", "2024-01-01T00:00:00Z");

    IssueForest forest = ForestBuilder().build({parent, blocked, ready_new, ready_old, blocker});

    EXPECT_EQ(ids_of(forest, node_by_id(forest, "ab-100").children),
              (std::vector<std::string>{"ab-101", "ab-102", "ab-103"}));
}

TEST(ForestSortTests, Children_FullPriorityLadder)
{
    auto parent = make_issue("ab-1", "open", "2024-01-01T00:00:00Z");
    auto closed = make_issue("ab-2", "closed", "2023-01-01T00:00:00Z");
    auto blocked = make_issue("ab-3", "blocked", "2023-01-01T00:00:00Z");
    auto ready = make_issue("ab-4", "open", "2024-06-01T00:00:00Z");
    auto active = make_issue("ab-5", "in_progress", "2024-09-01T00:00:00Z");
    for (auto* child : {&closed, &blocked, &ready, &active})
    {
        add_parent(*child, "ab-1");
    }

    IssueForest forest = ForestBuilder().build({parent, closed, blocked, ready, active});

    EXPECT_EQ(ids_of(forest, node_by_id(forest, "ab-1").children),
              (std::vector<std::string>{"ab-5", "ab-4", "ab-3", "ab-2"}));
}

TEST(ForestSortTests, Ties_BrokenByIssueId)
{
    auto c = make_issue("ab-c", "open", "2024-01-01T00:00:00Z");
    auto a = make_issue("ab-a", "open", "2024-01-01T00:00:00Z");
    auto b = make_issue("ab-b", "open", "2024-01-01T00:00:00Z");

    IssueForest forward = ForestBuilder().build({a, b, c});
    IssueForest reversed = ForestBuilder().build({c, b, a});

    const std::vector<std::string> expected{"ab-a", "ab-b", "ab-c"};
    EXPECT_EQ(root_ids(forward), expected);
    EXPECT_EQ(root_ids(reversed), expected);
}

TEST(ForestSortTests, Ties_EquivalentInstantsInDifferentZones)
{
    auto later_id = make_issue("ab-2", "open", "2024-01-01T02:00:00+02:00");
    auto earlier_id = make_issue("ab-1", "open", "2024-01-01T00:00:00Z");

    IssueForest forest = ForestBuilder().build({later_id, earlier_id});

    EXPECT_EQ(node_by_id(forest, "ab-1").sort_timestamp, node_by_id(forest, "ab-2").sort_timestamp);
    EXPECT_EQ(root_ids(forest), (std::vector<std::string>{"ab-1", "ab-2"}));
}

TEST(ForestSortTests, DisplayLess_OrdersPriorityTimestampThenId)
{
    Node a;
    a.issue.id = "ab-2";
    a.sort_priority = SortPriority::Ready;
    a.sort_timestamp = ts("2024-01-01T00:00:00Z");

    Node b = a;
    b.issue.id = "ab-1";
    EXPECT_TRUE(ForestBuilder::display_less(b, a));
    EXPECT_FALSE(ForestBuilder::display_less(a, b));

    b.sort_timestamp = ts("2024-01-02T00:00:00Z");
    EXPECT_TRUE(ForestBuilder::display_less(a, b));

    b.sort_priority = SortPriority::InProgress;
    EXPECT_TRUE(ForestBuilder::display_less(b, a));
    EXPECT_FALSE(ForestBuilder::display_less(a, a));
}
