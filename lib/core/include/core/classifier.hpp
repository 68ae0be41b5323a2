#pragma once

#include <array>
#include <chrono>
#include <core/parsed_uuid.hpp>
#include <core/verdict.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace uuid_autopsy::core {

/// Node value of Microsoft's predefined IUnknown GUID, {00000000-0000-0000-C000-000000000046}.
inline constexpr std::uint64_t microsoft_iunknown_node = 0x46;

[[nodiscard]] auto is_known_microsoft_guid(const parsed_uuid &uuid) -> bool;

/**
 * @brief Plausibility rules, in the order they are evaluated.
 *
 * Each rule returns a verdict when it applies and std::nullopt otherwise.
 * The first rule that applies decides the outcome.
 */
namespace rules {

  using result_t = std::optional<verdict>;
  using rule_t = result_t (*)(const parsed_uuid &uuid, std::chrono::system_clock::time_point now);

  /// All six fields zero.
  [[nodiscard]] auto nil(const parsed_uuid &uuid, std::chrono::system_clock::time_point now) -> result_t;

  /// Microsoft variant: known GUID, or inconclusive (unrecognized).
  [[nodiscard]] auto microsoft(const parsed_uuid &uuid, std::chrono::system_clock::time_point now) -> result_t;

  /// RFC 4122 variant with a version nibble outside 1-5.
  [[nodiscard]] auto undefined_version(const parsed_uuid &uuid, std::chrono::system_clock::time_point now)
    -> result_t;

  /// RFC 4122 version 1: valid only if the timestamp is a reasonable time.
  [[nodiscard]] auto time_based(const parsed_uuid &uuid, std::chrono::system_clock::time_point now) -> result_t;

  /// RFC 4122 versions 2-5.
  [[nodiscard]] auto defined_version(const parsed_uuid &uuid, std::chrono::system_clock::time_point now)
    -> result_t;

  /// NCS and reserved variants cannot be judged from the bit pattern.
  [[nodiscard]] auto foreign_variant(const parsed_uuid &uuid, std::chrono::system_clock::time_point now)
    -> result_t;

  inline constexpr std::array<rule_t, 6> ordered{ &nil,
    &microsoft,
    &undefined_version,
    &time_based,
    &defined_version,
    &foreign_variant };

  /// Rule names, index-aligned with ordered.
  inline constexpr std::array<std::string_view, 6> names{ "nil",
    "microsoft",
    "undefined_version",
    "time_based",
    "defined_version",
    "foreign_variant" };

}// namespace rules

/**
 * @brief Runs the plausibility rules against a decoded UUID.
 *
 * @param uuid Decoded UUID
 * @param now Analysis time, used only by the version 1 timestamp check
 * @return Verdict from the first applicable rule
 */
[[nodiscard]] auto classify(const parsed_uuid &uuid, std::chrono::system_clock::time_point now) -> verdict;

}// namespace uuid_autopsy::core
