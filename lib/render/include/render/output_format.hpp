#pragma once

#include <core/findings.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace uuid_autopsy::render {

enum class output_format {
  report,
  json,
  canonical,
  guid,
  urn,
  oid,
  integer,
};

[[nodiscard]] auto parse_output_format(std::string_view name) -> std::optional<output_format>;

/**
 * @brief Renders findings in the requested format, newline-terminated.
 */
[[nodiscard]] auto render(const core::findings &result, output_format format) -> std::string;

}// namespace uuid_autopsy::render
