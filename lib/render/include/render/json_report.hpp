#pragma once

#include <core/findings.hpp>
#include <nlohmann/json.hpp>

namespace uuid_autopsy::render {

/**
 * @brief Serializes findings for machine consumption.
 *
 * Keys: input, canonical, guid, urn, oid, integer, fields, derived, variant,
 * version, verdict, summary, time, clock_sequence_lines, timestamp_notes, layout.
 */
[[nodiscard]] auto to_json(const core::findings &result) -> nlohmann::json;

}// namespace uuid_autopsy::render
