#include <core/parsed_uuid.hpp>

#include <charconv>
#include <fmt/format.h>
#include <regex>
#include <string>

namespace uuid_autopsy::core {

namespace {

  template<typename T> auto parse_hex_group(const std::csub_match &group) -> T
  {
    T value{};
    const auto *first = &*group.first;
    const auto *last = first + group.length();
    const auto [ptr, ec] = std::from_chars(first, last, value, 16);
    if (ec != std::errc{} or ptr != last) { throw malformed_input(group.str()); }
    return value;
  }

}// namespace

auto parsed_uuid::parse(std::string_view text) -> parsed_uuid
{
  static const std::regex canonical_pattern(
    "^([0-9a-f]{8})-([0-9a-f]{4})-([0-9a-f]{4})-([0-9a-f]{2})([0-9a-f]{2})-([0-9a-f]{12})$",
    std::regex::icase | std::regex::optimize);

  std::cmatch groups;
  if (not std::regex_match(text.data(), text.data() + text.size(), groups, canonical_pattern)) {
    throw malformed_input(text);
  }

  return parsed_uuid{ parse_hex_group<std::uint32_t>(groups[1]),
    parse_hex_group<std::uint16_t>(groups[2]),
    parse_hex_group<std::uint16_t>(groups[3]),
    parse_hex_group<std::uint8_t>(groups[4]),
    parse_hex_group<std::uint8_t>(groups[5]),
    parse_hex_group<std::uint64_t>(groups[6]) };
}

auto parsed_uuid::try_parse(std::string_view text) -> std::optional<parsed_uuid>
{
  try {
    return parse(text);
  } catch (const malformed_input &) {
    return std::nullopt;
  }
}

auto parsed_uuid::to_string() const -> std::string
{
  return fmt::format("{:08x}-{:04x}-{:04x}-{:02x}{:02x}-{:012x}",
    time_low_,
    time_mid_,
    time_hi_and_version_,
    clock_seq_hi_and_reserved_,
    clock_seq_low_,
    node_);
}

auto parsed_uuid::to_guid() const -> std::string
{
  return fmt::format("{{{:08X}-{:04X}-{:04X}-{:02X}{:02X}-{:012X}}}",
    time_low_,
    time_mid_,
    time_hi_and_version_,
    clock_seq_hi_and_reserved_,
    clock_seq_low_,
    node_);
}

auto parsed_uuid::to_urn() const -> std::string { return "urn:uuid:" + to_string(); }

auto parsed_uuid::to_oid() const -> std::string { return "2.25." + to_integer_string(); }

auto parsed_uuid::to_uint128() const -> boost::multiprecision::uint128_t
{
  boost::multiprecision::uint128_t value = time_low_;
  value = (value << 16U) | time_mid_;
  value = (value << 16U) | time_hi_and_version_;
  value = (value << 8U) | clock_seq_hi_and_reserved_;
  value = (value << 8U) | clock_seq_low_;
  value = (value << 48U) | node_;
  return value;
}

auto parsed_uuid::to_integer_string() const -> std::string { return to_uint128().str(); }

auto parsed_uuid::to_boost_uuid() const -> boost::uuids::uuid
{
  boost::uuids::uuid result{};
  auto value = to_uint128();
  for (auto byte = result.end(); byte != result.begin();) {
    --byte;
    *byte = static_cast<std::uint8_t>(value & 0xFFU);
    value >>= 8U;
  }
  return result;
}

}// namespace uuid_autopsy::core
