// =================================================================
// include/Rewind/Timestamp.hpp
// =================================================================
// ISO-8601 timestamp helpers used for patch ordering and range queries.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace Rewind {

/**
 * @brief Format a time point as UTC ISO-8601 with millisecond precision
 * @return e.g. "2024-05-01T12:30:45.123Z"
 */
std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);

/// Current time, formatted with formatTimestamp()
std::string currentTimestamp();

/**
 * @brief Parse an ISO-8601 timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS", an optional fraction and an optional
 * "Z" or "+HH:MM"/"-HH:MM" suffix. A missing suffix means UTC.
 *
 * @return Milliseconds since the Unix epoch, or std::nullopt if malformed
 */
std::optional<int64_t> parseTimestamp(const std::string& text);

/// Milliseconds since the Unix epoch for a time point
int64_t toEpochMillis(const std::chrono::system_clock::time_point& time_point);

} // namespace Rewind
