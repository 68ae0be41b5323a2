#include <platform/time_utils.hpp>

#include <chrono>
#include <fmt/format.h>

namespace uuid_autopsy::platform {

namespace {

  struct utc_parts
  {
    int year;
    unsigned month;
    unsigned day;
    std::int64_t hours;
    std::int64_t minutes;
    std::int64_t seconds;
    std::int64_t ticks;
  };

  auto split_utc(hundred_ns_time time) -> utc_parts
  {
    using namespace std::chrono;

    const auto day_point = floor<days>(time);
    const year_month_day ymd{ day_point };
    const hh_mm_ss<hundred_ns> hms{ time - day_point };

    return utc_parts{ .year = static_cast<int>(ymd.year()),
      .month = static_cast<unsigned>(ymd.month()),
      .day = static_cast<unsigned>(ymd.day()),
      .hours = hms.hours().count(),
      .minutes = hms.minutes().count(),
      .seconds = hms.seconds().count(),
      .ticks = hms.subseconds().count() };
  }

}// namespace

auto system_clock_source::now() const -> std::chrono::system_clock::time_point { return std::chrono::system_clock::now(); }

auto format_utc(hundred_ns_time time) -> std::string
{
  const auto parts = split_utc(time);
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:07d} UTC",
    parts.year,
    parts.month,
    parts.day,
    parts.hours,
    parts.minutes,
    parts.seconds,
    parts.ticks);
}

auto format_utc_seconds(hundred_ns_time time) -> std::string
{
  const auto parts = split_utc(time);
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d} UTC",
    parts.year,
    parts.month,
    parts.day,
    parts.hours,
    parts.minutes,
    parts.seconds);
}

}// namespace uuid_autopsy::platform
