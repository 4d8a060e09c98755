/**
 * @file forest_enums.cpp
 */
#include "issueforest/common/forest_enums.hpp"

#include <cctype>

namespace issueforest
{

namespace
{

std::string normalize_token(const std::string& raw)
{
    size_t begin = 0;
    size_t end = raw.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin])))
    {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])))
    {
        --end;
    }
    std::string result = raw.substr(begin, end - begin);
    for (char& c : result)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

} // namespace

RelationshipType parse_relationship_type(const std::string& raw)
{
    const std::string token = normalize_token(raw);
    if (token == "parent-child")
    {
        return RelationshipType::ParentChild;
    }
    if (token == "blocks")
    {
        return RelationshipType::Blocks;
    }
    if (token == "related")
    {
        return RelationshipType::Related;
    }
    if (token == "discovered-from")
    {
        return RelationshipType::DiscoveredFrom;
    }
    return RelationshipType::Unknown;
}

const char* to_string(RelationshipType type) noexcept
{
    switch (type)
    {
    case RelationshipType::ParentChild:
        return "parent-child";
    case RelationshipType::Blocks:
        return "blocks";
    case RelationshipType::Related:
        return "related";
    case RelationshipType::DiscoveredFrom:
        return "discovered-from";
    case RelationshipType::Unknown:
        break;
    }
    return "unknown";
}

IssueStatus parse_issue_status(const std::string& raw)
{
    const std::string token = normalize_token(raw);
    if (token == "open")
    {
        return IssueStatus::Open;
    }
    if (token == "in_progress")
    {
        return IssueStatus::InProgress;
    }
    if (token == "blocked")
    {
        return IssueStatus::Blocked;
    }
    if (token == "deferred")
    {
        return IssueStatus::Deferred;
    }
    if (token == "closed")
    {
        return IssueStatus::Closed;
    }
    return IssueStatus::Unknown;
}

const char* to_string(IssueStatus status) noexcept
{
    switch (status)
    {
    case IssueStatus::Open:
        return "open";
    case IssueStatus::InProgress:
        return "in_progress";
    case IssueStatus::Blocked:
        return "blocked";
    case IssueStatus::Deferred:
        return "deferred";
    case IssueStatus::Closed:
        return "closed";
    case IssueStatus::Unknown:
        break;
    }
    return "unknown";
}

} // namespace issueforest
