#include <core/time_interpreter.hpp>

namespace uuid_autopsy::core {

auto is_reasonable_time(std::uint64_t timestamp, std::chrono::system_clock::time_point now) -> bool
{
  using namespace std::chrono;

  const auto time = calendar_time(timestamp);
  const year_month_day ymd{ floor<days>(time) };
  const auto latest = floor<platform::hundred_ns>(now) + future_tolerance;

  return ymd.year() >= year{ earliest_year } and time < latest;
}

}// namespace uuid_autopsy::core
