#include <core/classifier.hpp>

#include <core/time_interpreter.hpp>
#include <core/uuid_kinds.hpp>
#include <spdlog/spdlog.h>

namespace uuid_autopsy::core {

auto is_known_microsoft_guid(const parsed_uuid &uuid) -> bool
{
  return variant_of(uuid) == variant_kind::microsoft and uuid.clock_sequence_value() == 0
         and uuid.timestamp_value() == 0 and uuid.node() == microsoft_iunknown_node;
}

namespace rules {

  auto nil(const parsed_uuid &uuid, std::chrono::system_clock::time_point /*now*/) -> result_t
  {
    if (uuid.is_nil()) { return nil_uuid{}; }
    return std::nullopt;
  }

  auto microsoft(const parsed_uuid &uuid, std::chrono::system_clock::time_point /*now*/) -> result_t
  {
    if (variant_of(uuid) != variant_kind::microsoft) { return std::nullopt; }
    if (is_known_microsoft_guid(uuid)) { return microsoft_known_value{}; }
    return unrecognized{};
  }

  auto undefined_version(const parsed_uuid &uuid, std::chrono::system_clock::time_point /*now*/) -> result_t
  {
    if (variant_of(uuid) == variant_kind::rfc_4122 and version_of(uuid) == version_kind::undefined) {
      return definitely_invalid{};
    }
    return std::nullopt;
  }

  auto time_based(const parsed_uuid &uuid, std::chrono::system_clock::time_point now) -> result_t
  {
    if (variant_of(uuid) != variant_kind::rfc_4122 or version_of(uuid) != version_kind::time_based) {
      return std::nullopt;
    }
    if (is_reasonable_time(uuid.timestamp_value(), now)) { return valid{ .version = uuid.version() }; }
    return definitely_invalid{};
  }

  auto defined_version(const parsed_uuid &uuid, std::chrono::system_clock::time_point /*now*/) -> result_t
  {
    if (variant_of(uuid) != variant_kind::rfc_4122) { return std::nullopt; }
    switch (version_of(uuid)) {
    case version_kind::dce_security:
    case version_kind::name_based_md5:
    case version_kind::random:
    case version_kind::name_based_sha1:
      return valid{ .version = uuid.version() };
    case version_kind::undefined:
    case version_kind::time_based:
      break;
    }
    return std::nullopt;
  }

  auto foreign_variant(const parsed_uuid &uuid, std::chrono::system_clock::time_point /*now*/) -> result_t
  {
    const auto variant = variant_of(uuid);
    if (variant == variant_kind::ncs or variant == variant_kind::reserved) { return unrecognized{}; }
    return std::nullopt;
  }

}// namespace rules

auto classify(const parsed_uuid &uuid, std::chrono::system_clock::time_point now) -> verdict
{
  for (std::size_t index = 0; index < rules::ordered.size(); ++index) {
    if (auto outcome = rules::ordered.at(index)(uuid, now)) {
      spdlog::debug("[classifier] {} decided by rule '{}': {}", uuid.to_string(), rules::names.at(index), name_of(*outcome));
      return *outcome;
    }
  }

  // Unreachable while the rules cover every variant.
  return unrecognized{};
}

}// namespace uuid_autopsy::core
