#pragma once

#include <string>
#include <chrono>
#include "common/types.hpp"

namespace updown {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string (UTC, millisecond precision).
 */
std::string to_iso8601(WallClock t);
std::string to_iso8601(int64_t epoch_ms);

/**
 * Parse ISO 8601 ("2025-01-01T17:00:00Z", optional fraction, optional
 * +HH:MM offset, or a bare date). Throws std::invalid_argument.
 */
WallClock from_iso8601(const std::string& s);

std::string now_iso8601();

int64_t epoch_ms();
int64_t to_epoch_ms(WallClock t);
WallClock from_epoch_ms(int64_t ms);

/**
 * Minute within the current UTC hour, 0-59. Hour boundaries coincide in
 * every whole-hour timezone the markets settle in.
 */
int minute_of_hour(WallClock t);

/**
 * Hour of day (0-23) in America/New_York, applying the US DST rule
 * (second Sunday of March to first Sunday of November, 2:00 local).
 */
int eastern_hour(WallClock t);
bool is_us_eastern_dst(WallClock t);

std::string format_duration_ms(int64_t ms);

} // namespace time_utils
} // namespace updown
