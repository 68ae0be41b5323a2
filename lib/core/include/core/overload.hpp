#pragma once

namespace uuid_autopsy::core {

/**
 * @brief Builds a visitor out of one lambda per alternative.
 *
 * @code
 * std::visit(overload{
 *   [](const nil_uuid &) { return "nil"; },
 *   [](const valid &v) { return v.version == 4 ? "random" : "other"; },
 *   [](const auto &) { return "rejected"; }
 * }, outcome);
 * @endcode
 */
template<class... Ts> struct overload : Ts...
{
  using Ts::operator()...;
};

template<class... Ts> overload(Ts...) -> overload<Ts...>;

}// namespace uuid_autopsy::core
