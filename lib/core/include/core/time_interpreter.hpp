#pragma once

#include <chrono>
#include <cstdint>
#include <platform/time_utils.hpp>

namespace uuid_autopsy::core {

/// 1582-10-15 00:00:00 UTC, adoption of the Gregorian calendar.
inline constexpr platform::hundred_ns_time uuid_epoch{ std::chrono::sys_days{
  std::chrono::year{ 1582 } / std::chrono::October / std::chrono::day{ 15 } } };

/// Earliest year a UUID could plausibly have been generated per the RFC.
inline constexpr int earliest_year = 1990;

/// Allowed clock skew between generator and analyzer.
inline constexpr auto future_tolerance = std::chrono::hours{ 1 };

/**
 * @brief Calendar instant encoded by a 60-bit UUID timestamp.
 *
 * @param timestamp Count of 100 ns intervals since uuid_epoch
 */
[[nodiscard]] constexpr auto calendar_time(std::uint64_t timestamp) -> platform::hundred_ns_time
{
  return uuid_epoch + platform::hundred_ns{ static_cast<std::int64_t>(timestamp) };
}

/**
 * @brief Whether a timestamp falls between the start of 1990 and one hour past now.
 *
 * @param timestamp Count of 100 ns intervals since uuid_epoch
 * @param now Analysis time
 */
[[nodiscard]] auto is_reasonable_time(std::uint64_t timestamp, std::chrono::system_clock::time_point now) -> bool;

}// namespace uuid_autopsy::core
