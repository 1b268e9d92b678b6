/**
 * @file datetime_converter.h
 * @brief Conversions between system_clock time points, epoch milliseconds and ISO 8601 strings
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace talentvault::utils {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Current time truncated to millisecond precision
 *
 * Persisted timestamps carry milliseconds, so values are truncated at creation
 * to make in-memory and reloaded values compare equal.
 */
Timestamp NowMillis();

/**
 * @brief Milliseconds since the Unix epoch
 */
int64_t ToEpochMillis(Timestamp timestamp);

/**
 * @brief Time point from milliseconds since the Unix epoch
 */
Timestamp FromEpochMillis(int64_t millis);

/**
 * @brief Format as UTC ISO 8601 with milliseconds ("2025-01-08T22:00:00.123Z")
 */
std::string FormatIso8601(Timestamp timestamp);

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS[.mmm]Z"
 *
 * @return Time point, or std::nullopt on malformed input
 */
std::optional<Timestamp> ParseIso8601(std::string_view text);

}  // namespace talentvault::utils
