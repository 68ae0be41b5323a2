#include <render/output_format.hpp>

#include <array>
#include <render/json_report.hpp>
#include <render/text_report.hpp>
#include <utility>

namespace uuid_autopsy::render {

auto parse_output_format(std::string_view name) -> std::optional<output_format>
{
  static constexpr std::array<std::pair<std::string_view, output_format>, 7> names{ {
    { "report", output_format::report },
    { "json", output_format::json },
    { "canonical", output_format::canonical },
    { "guid", output_format::guid },
    { "urn", output_format::urn },
    { "oid", output_format::oid },
    { "integer", output_format::integer },
  } };

  for (const auto &[candidate, format] : names) {
    if (candidate == name) { return format; }
  }
  return std::nullopt;
}

auto render(const core::findings &result, output_format format) -> std::string
{
  switch (format) {
  case output_format::report:
    return render_text(result);
  case output_format::json:
    return to_json(result).dump(2) + "\n";
  case output_format::canonical:
    return result.forms.canonical + "\n";
  case output_format::guid:
    return result.forms.guid + "\n";
  case output_format::urn:
    return result.forms.urn + "\n";
  case output_format::oid:
    return result.forms.oid + "\n";
  case output_format::integer:
    return result.forms.integer + "\n";
  }
  return render_text(result);
}

}// namespace uuid_autopsy::render
