#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace bulkup {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * @brief Formats as ISO-8601 UTC with microseconds, e.g. 2026-01-02T03:04:05.000006Z
 */
std::string format_timestamp(Timestamp value);

/**
 * @brief Parses ISO-8601 timestamps written by format_timestamp
 *
 * Accepts an optional fractional part (up to microsecond precision is kept)
 * and a trailing "Z" or "+HH:MM"/"-HH:MM" offset. A missing offset is read
 * as UTC.
 */
std::optional<Timestamp> parse_timestamp(std::string_view text);

} // namespace bulkup
