/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * Formatting and parsing between std::chrono time points and the textual
 * forms used by PostgreSQL and the HTTP API. All functions work in UTC.
 *
 * @version 1.0.0
 * @date 2026-10-19
 */

#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace imghost {
namespace utils {

/**
 * @brief Format time_point as ISO 8601 UTC string
 *
 * @param tp std::chrono time_point
 * @param includeMilliseconds Include milliseconds in output
 * @return ISO 8601 string (e.g., "2026-10-19T12:34:56Z")
 */
std::string formatIso8601(
    const std::chrono::system_clock::time_point& tp,
    bool includeMilliseconds = false
);

/**
 * @brief Parse an ISO 8601 or PostgreSQL timestamp
 *
 * Accepts "YYYY-MM-DD[T| ]HH:MM:SS" with optional fractional seconds and an
 * optional zone designator ("Z", "+HH", "+HH:MM", "-HHMM"). A timestamp
 * without a zone is taken as UTC.
 *
 * @return time_point, or std::nullopt on malformed input
 */
std::optional<std::chrono::system_clock::time_point> parseTimestamp(
    const std::string& text
);

/**
 * @brief Get current time as ISO 8601 string
 */
std::string getCurrentIso8601(bool includeMilliseconds = false);

/**
 * @brief Milliseconds elapsed since a steady_clock start point
 */
long long elapsedMillis(const std::chrono::steady_clock::time_point& start);

} // namespace utils
} // namespace imghost
