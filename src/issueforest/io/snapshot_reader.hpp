/**
 * @file snapshot_reader.hpp
 * @brief Reads issue exports (JSON array or JSON Lines) into IssueRecords.
 */
#pragma once
#include "issueforest/common/common.hpp"
#include "issueforest/common/issue_record.hpp"

namespace issueforest
{

/**
 * @brief Reader for issue-store export files.
 *
 * @details
 * Two layouts are accepted:
 * - a single JSON array of issue objects, detected by a leading `[`;
 * - JSON Lines: one issue object per line, blank lines ignored.
 *
 * Parsing goes through yaml-cpp, whose flow syntax is a superset of JSON.
 * Unknown keys are ignored and missing keys keep the `IssueRecord` defaults.
 * Dependency entries accept both `{id, dependency_type}` and
 * `{depends_on_id, type}` spellings.
 *
 * @par Errors
 * Malformed documents, non-object entries and records without an `id` throw
 * `ForestError` with `ParseFailed`; the message names the line (JSON Lines) or
 * the array position.
 */
class SnapshotReader
{
public:
    static std::vector<IssueRecord> read_file(const std::string& path);

    static std::vector<IssueRecord> read_string(const std::string& text);
};

} // namespace issueforest
