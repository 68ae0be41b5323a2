#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

namespace uuid_autopsy::core {

/// Not RFC-shaped, or a Microsoft-variant value that is not a known GUID.
struct unrecognized
{
};

/// RFC-shaped but internally inconsistent.
struct definitely_invalid
{
};

struct nil_uuid
{
};

struct microsoft_known_value
{
};

struct valid
{
  std::uint8_t version;
};

using verdict = std::variant<unrecognized, definitely_invalid, nil_uuid, microsoft_known_value, valid>;

/**
 * @brief One-line summary sentence for a verdict.
 */
[[nodiscard]] auto summary_of(const verdict &outcome) -> std::string_view;

/**
 * @brief Short machine-friendly name, e.g. "nil_uuid" or "valid".
 */
[[nodiscard]] auto name_of(const verdict &outcome) -> std::string_view;

}// namespace uuid_autopsy::core
