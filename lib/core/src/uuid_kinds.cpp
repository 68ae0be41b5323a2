#include <core/uuid_kinds.hpp>

#include <fmt/format.h>

namespace uuid_autopsy::core {

auto to_string(variant_kind kind) -> std::string_view
{
  switch (kind) {
  case variant_kind::ncs:
    return "ncs";
  case variant_kind::rfc_4122:
    return "rfc_4122";
  case variant_kind::microsoft:
    return "microsoft";
  case variant_kind::reserved:
    return "reserved";
  }
  return "reserved";
}

auto to_string(version_kind kind) -> std::string_view
{
  switch (kind) {
  case version_kind::time_based:
    return "time_based";
  case version_kind::dce_security:
    return "dce_security";
  case version_kind::name_based_md5:
    return "name_based_md5";
  case version_kind::random:
    return "random";
  case version_kind::name_based_sha1:
    return "name_based_sha1";
  case version_kind::undefined:
    break;
  }
  return "undefined";
}

auto describe_variant(variant_kind kind) -> std::string_view
{
  switch (kind) {
  case variant_kind::ncs:
    return "0xx = NCS backward compatibility";
  case variant_kind::rfc_4122:
    return "10x = RFC 4122/DCE";
  case variant_kind::microsoft:
    return "110 = Microsoft backward compatibility";
  case variant_kind::reserved:
    return "111 = reserved";
  }
  return "111 = reserved";
}

auto describe_version(version_kind kind) -> std::string_view
{
  switch (kind) {
  case version_kind::time_based:
    return "RFC 4122/DCE, time-based";
  case version_kind::dce_security:
    return "DCE Security, embedded POSIX UID";
  case version_kind::name_based_md5:
    return "RFC 4122, name-based MD5 hash";
  case version_kind::random:
    return "RFC 4122, randomly-generated";
  case version_kind::name_based_sha1:
    return "RFC 4122, name-based SHA-1 hash";
  case version_kind::undefined:
    break;
  }
  return "undefined";
}

auto describe_clock_sequence(std::uint8_t version, std::uint16_t clock_sequence) -> std::string
{
  switch (version) {
  case 1:
    return fmt::format("{} (clock sequence value)", clock_sequence);
  case 3:
    return "MD5 hash bits 66-95";
  case 4:
    return "random bits";
  case 5:
    return "SHA-1 hash bits 66-95";
  default:
    return fmt::format("{} (???)", clock_sequence);
  }
}

}// namespace uuid_autopsy::core
