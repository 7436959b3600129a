/**
 * @file time_utils.h
 * @brief RFC 3339 timestamp formatting and parsing
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace memex::utils {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Format as RFC 3339 in UTC with nanoseconds (e.g. "2024-05-01T10:20:30.123456789Z")
 *
 * Trailing zeros of the fraction are kept so that the text sorts like the value.
 */
std::string FormatTimestamp(Timestamp timestamp);

/**
 * @brief Parse an RFC 3339 timestamp ("Z" or "+hh:mm"/"-hh:mm" offset, optional fraction)
 * @return Parsed time point, or std::nullopt if malformed
 */
std::optional<Timestamp> ParseTimestamp(std::string_view text);

/**
 * @brief Seconds since the Unix epoch
 */
int64_t ToUnixSeconds(Timestamp timestamp);

}  // namespace memex::utils
