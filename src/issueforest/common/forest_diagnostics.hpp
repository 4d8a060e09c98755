/**
 * @file forest_diagnostics.hpp
 */
#pragma once
#include "issueforest/common/common.hpp"

namespace issueforest
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Input irregularity that was skipped or defaulted.
    Error     ///< Blocking issue that prevents the forest from being built.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    Cycle,                      ///< A cycle was detected in the parent-child hierarchy.
    DanglingReference,          ///< An edge names an issue absent from the input.
    MissingIssueId,             ///< A record without an ID; the record is skipped.
    DuplicateIssueId,           ///< Two input records share an ID; the later one wins.
    UnknownRelationship,        ///< An edge type the linker does not understand.
    UnparseableTimestamp        ///< No sort timestamp could be parsed; sentinel used.
};

/**
 * @brief Human-readable name of a diagnostic category.
 */
inline const char* to_string(DiagnosticCategory category) noexcept
{
    switch (category)
    {
    case DiagnosticCategory::Cycle:
        return "cycle";
    case DiagnosticCategory::DanglingReference:
        return "dangling-reference";
    case DiagnosticCategory::MissingIssueId:
        return "missing-issue-id";
    case DiagnosticCategory::DuplicateIssueId:
        return "duplicate-issue-id";
    case DiagnosticCategory::UnknownRelationship:
        return "unknown-relationship";
    case DiagnosticCategory::UnparseableTimestamp:
        return "unparseable-timestamp";
    }
    return "unknown";
}

/**
 * @brief A single diagnostic item (error or warning).
 *
 * @details
 * `involved_issues` lists issue IDs in a category-specific order. For `Cycle`
 * it is the offending path, starting and ending at the re-entered issue.
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Issue IDs involved in this issue.
    std::vector<std::string> involved_issues;
};

// ============================================================================
// ForestDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected while building a forest.
 *
 * @details
 * `ForestDiagnostics` records every input irregularity the builder tolerated.
 * None of the warnings change the outcome of a build: dangling references are
 * dropped, duplicate IDs resolved in favour of the later record, malformed
 * timestamps replaced by the distant-future sentinel. The only error category
 * is `Cycle`, which also makes the build throw.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once the build returns, the data is immutable.
 * - Concurrent reads are safe.
 */
class ForestDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Count warnings of one category.
     */
    size_t count(DiagnosticCategory category) const noexcept
    {
        return static_cast<size_t>(std::count_if(
            m_warnings.begin(), m_warnings.end(),
            [category](const DiagnosticItem& item) { return item.category == category; }));
    }

    /**
     * @brief Append an item to the errors or warnings list by its severity.
     */
    void add(DiagnosticItem item)
    {
        if (item.severity == DiagnosticSeverity::Error)
        {
            m_errors.push_back(std::move(item));
        }
        else
        {
            m_warnings.push_back(std::move(item));
        }
    }

    void add_warning(DiagnosticCategory category, std::string message,
                     std::vector<std::string> involved_issues)
    {
        add(DiagnosticItem{DiagnosticSeverity::Warning, category, std::move(message),
                           std::move(involved_issues)});
    }

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace issueforest
