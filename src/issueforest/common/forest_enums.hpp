/**
 * @file forest_enums.hpp
 */
#pragma once
#include "issueforest/common/common.hpp"

namespace issueforest
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for node indices.
 *
 * @details
 * `NodeIdx` is a type alias for `size_t` used to identify nodes in the forest
 * arena. Every edge stored on a node (children, parents, blockers, ...) is a
 * `NodeIdx`. This alias exists for clarity in API signatures and documentation,
 * not for compile-time type safety.
 */
using NodeIdx = size_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Enumeration of typed relationships between two issues.
 *
 * @details
 * The relationship type decides which edges the linker creates and whether a
 * reciprocal edge is added on the other node.
 *
 * - `ParentChild`: hierarchy. Reciprocal (parents and children).
 * - `Blocks`: ordering constraint. Reciprocal (blocked_by and blocks).
 * - `Related`: symmetric association. Reciprocal.
 * - `DiscoveredFrom`: provenance. One-directional.
 * - `Unknown`: any other type string; ignored by the linker.
 */
enum class RelationshipType
{
    ParentChild,
    Blocks,
    Related,
    DiscoveredFrom,
    Unknown
};

/**
 * @brief Normalised lifecycle state of an issue.
 *
 * @details
 * Statuses not recognised by this library (for example values introduced by a
 * newer issue store) are accepted and mapped to `Unknown`. They are treated as
 * neither ready nor in progress.
 */
enum class IssueStatus
{
    Open,
    InProgress,
    Blocked,
    Deferred,
    Closed,
    Unknown
};

/**
 * @brief Priority class used as the primary display sort key.
 *
 * @details
 * Lower values sort first (most urgent). The numeric values are part of the
 * observable sort key and must not be reordered.
 */
enum class SortPriority : int
{
    InProgress = 1, ///< Work currently being done.
    Ready = 2,      ///< Open and not blocked.
    Open = 3,       ///< Open but blocked, or any other non-closed status.
    Closed = 4      ///< Finished work.
};

/**
 * @brief Parse a relationship type string such as `"parent-child"`.
 * @return The matching enumerator, or `RelationshipType::Unknown`.
 */
RelationshipType parse_relationship_type(const std::string& raw);

/**
 * @brief Canonical string form of a relationship type.
 */
const char* to_string(RelationshipType type) noexcept;

/**
 * @brief Normalise a raw status string (trimmed, case-insensitive).
 * @return The matching enumerator, or `IssueStatus::Unknown` for blank or
 *         unrecognised input.
 */
IssueStatus parse_issue_status(const std::string& raw);

/**
 * @brief Canonical string form of a status (`"unknown"` for Unknown).
 */
const char* to_string(IssueStatus status) noexcept;

/**
 * @brief True if the status represents finished work.
 */
inline bool is_terminal(IssueStatus status) noexcept
{
    return status == IssueStatus::Closed;
}

} // namespace issueforest
