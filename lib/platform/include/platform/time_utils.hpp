#pragma once

#include <chrono>
#include <cstdint>
#include <ratio>
#include <string>

namespace uuid_autopsy::platform {

/// 100-nanosecond ticks, the resolution of RFC 4122 timestamps.
using hundred_ns = std::chrono::duration<std::int64_t, std::ratio<1, 10'000'000>>;

/// System-clock time point at 100 ns resolution; spans 1582 through year 5000+ without overflow.
using hundred_ns_time = std::chrono::time_point<std::chrono::system_clock, hundred_ns>;

/**
 * @brief Reads the wall clock.
 *
 * Production clock source; tests substitute a fixed clock.
 */
struct system_clock_source
{
  [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point;
};

/**
 * @brief Formats a time point as "YYYY-MM-DD HH:MM:SS.fffffff UTC".
 *
 * @param time Time point at 100 ns resolution
 * @return UTC calendar time with all seven fractional digits
 */
[[nodiscard]] auto format_utc(hundred_ns_time time) -> std::string;

/**
 * @brief Formats a time point as "YYYY-MM-DD HH:MM:SS UTC", dropping sub-second ticks.
 */
[[nodiscard]] auto format_utc_seconds(hundred_ns_time time) -> std::string;

}// namespace uuid_autopsy::platform
