#pragma once

#include <chrono>
#include <concepts>

namespace uuid_autopsy::concepts {

/**
 * @brief Concept for anything that can report the current wall-clock time.
 *
 * The analyzer reads it once per analysis for the future-time bound.
 */
template<typename T>
concept clock_source = requires(const T clock) {
  { clock.now() } -> std::convertible_to<std::chrono::system_clock::time_point>;
};

}// namespace uuid_autopsy::concepts
