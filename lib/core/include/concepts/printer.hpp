#pragma once

#include <concepts>
#include <string_view>

namespace uuid_autopsy::concepts {

/**
 * @brief Concept for a sink of already-rendered text.
 */
template<typename T>
concept printer = requires(T printer, std::string_view text) {
  { printer.print(text) } -> std::convertible_to<void>;
};

}// namespace uuid_autopsy::concepts
