/**
 * @file issue_record.hpp
 * @brief Plain data types describing issues as exported by an issue store.
 */
#pragma once
#include "issueforest/common/common.hpp"

namespace issueforest
{

/**
 * @brief A comment attached to an issue.
 */
struct Comment
{
    int64_t id = 0;
    std::string issue_id;
    std::string author;
    std::string text;
    std::string created_at;
};

/**
 * @brief Outgoing typed reference from the owning issue to `target_id`.
 *
 * @details
 * For `"parent-child"` the target is the parent of the owning issue. For
 * `"blocks"` the target blocks the owning issue.
 */
struct Dependency
{
    std::string target_id;
    std::string type;
};

/**
 * @brief Incoming typed reference: issue `id` depends on the owning issue.
 *
 * @details
 * Only `"parent-child"` dependents are used, where `id` names a child of the
 * owning issue.
 */
struct Dependent
{
    std::string id;
    std::string type;
};

/**
 * @brief One issue record as produced by an issue-store export.
 *
 * @details
 * The record is treated as opaque, already-validated input. Timestamps are
 * kept as the raw RFC3339 strings found in the export; they may be empty or
 * malformed and are only parsed when a sort key is computed.
 */
struct IssueRecord
{
    std::string id;
    std::string title;
    std::string status;
    std::string issue_type;
    int priority = 0;
    std::string description;
    std::string design;
    std::string acceptance_criteria;
    std::string notes;
    std::string external_ref;
    std::string created_at;
    std::string updated_at;
    std::string closed_at;
    std::vector<std::string> labels;
    std::vector<Comment> comments;
    std::vector<Dependency> dependencies;
    std::vector<Dependent> dependents;
};

} // namespace issueforest
