/**
 * @file issue_index_tests.cpp
 * Unit tests for issueforest::IssueIndex
 */
#include <gtest/gtest.h>
#include "issueforest/common/issue_index.hpp"

#include <limits>
#include <string>
#include <vector>

using namespace issueforest;

// ============================================================================
// npos constant
// ============================================================================

TEST(IssueIndexTests, Npos_IsSizeMax)
{
    EXPECT_EQ(IssueIndex::npos, std::numeric_limits<std::size_t>::max());
}

// ============================================================================
// Insert
// ============================================================================

TEST(IssueIndexTests, Insert_SequentialInsertsReturnIncrementingIndices)
{
    IssueIndex index;
    EXPECT_EQ(index.insert("ab-1"), 0u);
    EXPECT_EQ(index.insert("ab-2"), 1u);
    EXPECT_EQ(index.insert("ab-3"), 2u);
}

TEST(IssueIndexTests, Insert_DuplicateReturnsExistingIndex)
{
    IssueIndex index;
    index.insert("ab-1");
    index.insert("ab-2");
    index.insert("ab-3");

    EXPECT_EQ(index.insert("ab-2"), 1u);
    EXPECT_EQ(index.size(), 3u);  // No new element added
}

TEST(IssueIndexTests, Insert_IdsAreCaseSensitive)
{
    IssueIndex index;
    index.insert("ab-1");
    EXPECT_EQ(index.insert("AB-1"), 1u);
}

TEST(IssueIndexTests, Insert_EmptyIdThrows)
{
    IssueIndex index;
    EXPECT_THROW(index.insert(""), std::invalid_argument);
}

TEST(IssueIndexTests, Insert_EmptyIdDoesNotModifyIndex)
{
    IssueIndex index;
    index.insert("ab-1");
    try {
        index.insert("");
    } catch (const std::invalid_argument&) {
        // Expected
    }
    EXPECT_EQ(index.size(), 1u);
}

// ============================================================================
// Find / contains
// ============================================================================

TEST(IssueIndexTests, Find_ExistingIdReturnsIndex)
{
    IssueIndex index;
    index.insert("ab-1");
    index.insert("ab-2");
    EXPECT_EQ(index.find("ab-2"), 1u);
    EXPECT_TRUE(index.contains("ab-1"));
}

TEST(IssueIndexTests, Find_MissingIdReturnsNpos)
{
    IssueIndex index;
    index.insert("ab-1");
    EXPECT_EQ(index.find("ab-9"), IssueIndex::npos);
    EXPECT_EQ(index.find(""), IssueIndex::npos);
    EXPECT_FALSE(index.contains("ab-9"));
}

TEST(IssueIndexTests, Find_IsNoexcept)
{
    IssueIndex index;
    static_assert(noexcept(index.find(std::string())), "find must be noexcept");
}

// ============================================================================
// At
// ============================================================================

TEST(IssueIndexTests, At_ValidIndexReturnsId)
{
    IssueIndex index;
    index.insert("ab-1");
    index.insert("ab-2");
    EXPECT_EQ(index.at(0), "ab-1");
    EXPECT_EQ(index.at(1), "ab-2");
}

TEST(IssueIndexTests, At_InvalidIndexThrows)
{
    IssueIndex index;
    EXPECT_THROW(index.at(0), std::out_of_range);
    index.insert("ab-1");
    EXPECT_THROW(index.at(1), std::out_of_range);
    EXPECT_THROW(index.at(IssueIndex::npos), std::out_of_range);
}

// ============================================================================
// Enumerate
// ============================================================================

TEST(IssueIndexTests, Enumerate_EmptyIndexNoCallbacks)
{
    IssueIndex index;
    int call_count = 0;
    index.enumerate([&](NodeIdx, const std::string&) {
        ++call_count;
    });
    EXPECT_EQ(call_count, 0);
}

TEST(IssueIndexTests, Enumerate_PreservesInsertionOrder)
{
    IssueIndex index;
    index.insert("ab-3");
    index.insert("ab-1");
    index.insert("ab-3");  // duplicate
    index.insert("ab-2");

    std::vector<NodeIdx> indices;
    std::vector<std::string> ids;
    index.enumerate([&](NodeIdx idx, const std::string& id) {
        indices.push_back(idx);
        ids.push_back(id);
    });

    EXPECT_EQ(indices, (std::vector<NodeIdx>{0u, 1u, 2u}));
    EXPECT_EQ(ids, (std::vector<std::string>{"ab-3", "ab-1", "ab-2"}));
}

// ============================================================================
// Index-ID consistency (invariants)
// ============================================================================

TEST(IssueIndexTests, Invariant_FindOfAtReturnsIndex)
{
    IssueIndex index;
    for (const char* id : {"ab-1", "ab-10", "ab-2", "bd-1"})
    {
        index.insert(id);
    }
    for (NodeIdx i = 0; i < index.size(); ++i)
    {
        EXPECT_EQ(index.find(index.at(i)), i);
    }
}
