/**
 * @file timestamp.hpp
 * @brief RFC3339 timestamp parsing for sort keys.
 */
#pragma once
#include "issueforest/common/common.hpp"

namespace issueforest
{

/**
 * @brief A UTC instant with microsecond resolution.
 *
 * @details
 * Microseconds keep the representable range well past year 9999, which the
 * distant-future sentinel needs. Sub-microsecond digits in the input are
 * truncated.
 */
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

/**
 * @brief Parse an RFC3339 timestamp such as `2024-01-03T10:15:00Z` or
 *        `2024-01-03T10:15:00.123+02:00`.
 *
 * @details
 * Leading and trailing whitespace is ignored. The date, time and offset parts
 * are range-checked (including the day of month against leap years).
 *
 * @return The instant in UTC, or `std::nullopt` if `text` is not RFC3339.
 */
std::optional<Timestamp> parse_rfc3339(const std::string& text);

/**
 * @brief Return the first of `candidates` that parses, or `distant_future()`.
 */
Timestamp pick_timestamp(std::initializer_list<const std::string*> candidates);

/**
 * @brief Sentinel instant (9999-01-01T00:00:00Z) that sorts after any real timestamp.
 */
Timestamp distant_future() noexcept;

/**
 * @brief Format an instant as RFC3339 in UTC (`Z` suffix).
 * @details Fractional seconds are emitted only when non-zero.
 */
std::string format_rfc3339(Timestamp ts);

} // namespace issueforest
