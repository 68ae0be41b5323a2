#pragma once

#include <core/parsed_uuid.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace uuid_autopsy::core {

enum class variant_kind : std::uint8_t {
  ncs,
  rfc_4122,
  microsoft,
  reserved,
};

/**
 * @brief Version nibble, with everything outside 1-5 collapsed to undefined.
 */
enum class version_kind : std::uint8_t {
  undefined = 0,
  time_based = 1,
  dce_security = 2,
  name_based_md5 = 3,
  random = 4,
  name_based_sha1 = 5,
};

/**
 * @brief Maps the three variant bits to a variant, testing high bit first.
 *
 * 0xx is NCS, 10x is RFC 4122, 110 is Microsoft, 111 is reserved.
 */
[[nodiscard]] constexpr auto classify_variant(std::uint8_t variant_bits) -> variant_kind
{
  if ((variant_bits & 0b100U) == 0b000U) { return variant_kind::ncs; }
  if ((variant_bits & 0b110U) == 0b100U) { return variant_kind::rfc_4122; }
  if ((variant_bits & 0b111U) == 0b110U) { return variant_kind::microsoft; }
  return variant_kind::reserved;
}

[[nodiscard]] constexpr auto classify_version(std::uint8_t version) -> version_kind
{
  if (version < 1 or version > 5) { return version_kind::undefined; }
  return static_cast<version_kind>(version);
}

[[nodiscard]] constexpr auto variant_of(const parsed_uuid &uuid) -> variant_kind
{
  return classify_variant(uuid.variant_bits());
}

[[nodiscard]] constexpr auto version_of(const parsed_uuid &uuid) -> version_kind
{
  return classify_version(uuid.version());
}

[[nodiscard]] auto to_string(variant_kind kind) -> std::string_view;

[[nodiscard]] auto to_string(version_kind kind) -> std::string_view;

/**
 * @brief Variant description in bit-pattern form, e.g. "10x = RFC 4122/DCE".
 */
[[nodiscard]] auto describe_variant(variant_kind kind) -> std::string_view;

/**
 * @brief Generation algorithm named by the version, e.g. "RFC 4122, randomly-generated".
 */
[[nodiscard]] auto describe_version(version_kind kind) -> std::string_view;

/**
 * @brief What the 14 clock sequence bits hold for a given raw version nibble.
 *
 * Versions 1, 0, 2 and anything undefined embed the numeric value; the hash
 * and random versions describe the bits instead.
 */
[[nodiscard]] auto describe_clock_sequence(std::uint8_t version, std::uint16_t clock_sequence) -> std::string;

}// namespace uuid_autopsy::core
