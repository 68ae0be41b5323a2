#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/uuid/uuid.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace uuid_autopsy::core {

/**
 * @brief Thrown when text does not match the canonical 8-4-4-4-12 hex layout.
 */
class malformed_input : public std::invalid_argument
{
public:
  explicit malformed_input(std::string_view input)
    : std::invalid_argument("Not in UUID format: " + std::string(input)), input_(input)
  {}

  [[nodiscard]] auto input() const -> const std::string & { return input_; }

private:
  std::string input_;
};

/**
 * @brief A UUID split into the six fields laid out by RFC 4122.
 *
 * Immutable once built. Every derived value is recomputed from the stored
 * fields on each call.
 */
class parsed_uuid
{
public:
  static constexpr std::uint64_t node_mask = 0xFFFF'FFFF'FFFFULL;

  constexpr parsed_uuid(std::uint32_t time_low,
    std::uint16_t time_mid,
    std::uint16_t time_hi_and_version,
    std::uint8_t clock_seq_hi_and_reserved,
    std::uint8_t clock_seq_low,
    std::uint64_t node)
    : time_low_(time_low), time_mid_(time_mid), time_hi_and_version_(time_hi_and_version),
      clock_seq_hi_and_reserved_(clock_seq_hi_and_reserved), clock_seq_low_(clock_seq_low), node_(node & node_mask)
  {}

  /**
   * @brief Decodes the canonical textual form (case-insensitive).
   *
   * @param text UUID such as "6ba7b810-9dad-11d1-80b4-00c04fd430c8"
   * @return Decoded fields
   * @throws malformed_input if the text is not in canonical form
   */
  [[nodiscard]] static auto parse(std::string_view text) -> parsed_uuid;

  /**
   * @brief Non-throwing variant of parse().
   *
   * @return Decoded fields, or std::nullopt if the text is not in canonical form
   */
  [[nodiscard]] static auto try_parse(std::string_view text) -> std::optional<parsed_uuid>;

  [[nodiscard]] constexpr auto time_low() const -> std::uint32_t { return time_low_; }
  [[nodiscard]] constexpr auto time_mid() const -> std::uint16_t { return time_mid_; }
  [[nodiscard]] constexpr auto time_hi_and_version() const -> std::uint16_t { return time_hi_and_version_; }
  [[nodiscard]] constexpr auto clock_seq_hi_and_reserved() const -> std::uint8_t { return clock_seq_hi_and_reserved_; }
  [[nodiscard]] constexpr auto clock_seq_low() const -> std::uint8_t { return clock_seq_low_; }
  [[nodiscard]] constexpr auto node() const -> std::uint64_t { return node_; }

  /**
   * @brief The 60-bit timestamp, with the version nibble stripped.
   */
  [[nodiscard]] constexpr auto timestamp_value() const -> std::uint64_t
  {
    constexpr std::uint64_t time_hi_mask = 0x0FFF;
    return ((static_cast<std::uint64_t>(time_hi_and_version_) & time_hi_mask) << 48U)
           | (static_cast<std::uint64_t>(time_mid_) << 32U) | time_low_;
  }

  /**
   * @brief The 14-bit clock sequence; the top two bits of the high byte belong to the variant.
   */
  [[nodiscard]] constexpr auto clock_sequence_value() const -> std::uint16_t
  {
    constexpr unsigned clock_seq_hi_mask = 0b0011'1111;
    return static_cast<std::uint16_t>(((clock_seq_hi_and_reserved_ & clock_seq_hi_mask) << 8U) | clock_seq_low_);
  }

  // Raw 16 bits of the fourth group, variant bits included.
  [[nodiscard]] constexpr auto clock_seq_bits() const -> std::uint16_t
  {
    return static_cast<std::uint16_t>((static_cast<unsigned>(clock_seq_hi_and_reserved_) << 8U) | clock_seq_low_);
  }

  [[nodiscard]] constexpr auto variant_bits() const -> std::uint8_t
  {
    return static_cast<std::uint8_t>(clock_seq_hi_and_reserved_ >> 5U);
  }

  [[nodiscard]] constexpr auto version() const -> std::uint8_t
  {
    return static_cast<std::uint8_t>(time_hi_and_version_ >> 12U);
  }

  [[nodiscard]] constexpr auto is_nil() const -> bool
  {
    return time_low_ == 0 and time_mid_ == 0 and time_hi_and_version_ == 0 and clock_seq_hi_and_reserved_ == 0
           and clock_seq_low_ == 0 and node_ == 0;
  }

  /**
   * @brief Canonical lowercase hyphenated form.
   */
  [[nodiscard]] auto to_string() const -> std::string;

  /**
   * @brief Braced uppercase form, e.g. "{00000000-0000-0000-C000-000000000046}".
   */
  [[nodiscard]] auto to_guid() const -> std::string;

  [[nodiscard]] auto to_urn() const -> std::string;

  /**
   * @brief OID arc under 2.25 (ITU-T X.667), e.g. "2.25.<decimal value>".
   */
  [[nodiscard]] auto to_oid() const -> std::string;

  /**
   * @brief Big-endian concatenation of all fields as one 128-bit integer.
   */
  [[nodiscard]] auto to_uint128() const -> boost::multiprecision::uint128_t;

  [[nodiscard]] auto to_integer_string() const -> std::string;

  [[nodiscard]] auto to_boost_uuid() const -> boost::uuids::uuid;

  friend constexpr auto operator==(const parsed_uuid &, const parsed_uuid &) -> bool = default;

private:
  std::uint32_t time_low_;
  std::uint16_t time_mid_;
  std::uint16_t time_hi_and_version_;
  std::uint8_t clock_seq_hi_and_reserved_;
  std::uint8_t clock_seq_low_;
  std::uint64_t node_;
};

}// namespace uuid_autopsy::core
