#include <render/json_report.hpp>

#include <core/overload.hpp>
#include <core/uuid_kinds.hpp>
#include <core/verdict.hpp>
#include <platform/time_utils.hpp>
#include <string>

namespace uuid_autopsy::render {

namespace {

  auto verdict_json(const core::verdict &outcome) -> nlohmann::json
  {
    nlohmann::json j;
    j["kind"] = std::string(core::name_of(outcome));
    std::visit(core::overload{
                 [&j](const core::valid &accepted) { j["version"] = accepted.version; },
                 [](const auto &) {},
               },
      outcome);
    return j;
  }

}// namespace

auto to_json(const core::findings &result) -> nlohmann::json
{
  nlohmann::json j;

  j["input"] = result.input;
  j["canonical"] = result.forms.canonical;
  j["guid"] = result.forms.guid;
  j["urn"] = result.forms.urn;
  j["oid"] = result.forms.oid;
  j["integer"] = result.forms.integer;

  j["fields"] = {
    { "time_low", result.uuid.time_low() },
    { "time_mid", result.uuid.time_mid() },
    { "time_hi_and_version", result.uuid.time_hi_and_version() },
    { "clock_seq_hi_and_reserved", result.uuid.clock_seq_hi_and_reserved() },
    { "clock_seq_low", result.uuid.clock_seq_low() },
    { "node", result.uuid.node() },
  };

  j["derived"] = {
    { "timestamp", result.timestamp },
    { "clock_sequence", result.clock_sequence },
    { "variant_bits", result.variant_bits },
    { "version", result.version },
  };

  j["variant"] = {
    { "kind", std::string(core::to_string(result.variant)) },
    { "description", result.variant_description },
  };
  j["version"] = {
    { "number", result.version },
    { "kind", std::string(core::to_string(result.version_class)) },
    { "description", result.version_description },
  };

  j["verdict"] = verdict_json(result.outcome);
  j["summary"] = result.summary;

  j["time"] = {
    { "utc", platform::format_utc(result.time) },
    { "description", result.time_description },
    { "meaningful", result.time_is_meaningful },
  };

  j["clock_sequence_lines"] = result.clock_sequence_lines;
  j["timestamp_notes"] = result.timestamp_notes;

  j["layout"] = nlohmann::json::array();
  for (const auto &field : result.layout) {
    j["layout"].push_back({
      { "name", std::string(field.name) },
      { "first_bit", field.first_bit },
      { "width", field.width },
      { "value", field.value },
    });
  }

  return j;
}

}// namespace uuid_autopsy::render
