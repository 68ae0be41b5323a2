#include <render/text_report.hpp>

#include <fmt/format.h>
#include <iterator>

namespace uuid_autopsy::render {

auto render_text(const core::findings &result) -> std::string
{
  fmt::memory_buffer out;
  auto sink = std::back_inserter(out);

  fmt::format_to(sink, "{}\n\n", result.summary);
  fmt::format_to(sink, "┌┬┬┬┬┬┬┬────────────────────┬┬┬┬┬┬┬┐\n");
  fmt::format_to(sink, "││││││││ ┌┬┬┬───────────┬┬┬┐││││││││\n");
  fmt::format_to(sink, "││││││││ ││││  ┌┬┬── {:015x} ({})*\n", result.timestamp, result.time_description);
  fmt::format_to(sink, "││││││││ ││││  │││\n");
  fmt::format_to(sink, "{}\n", result.forms.canonical);
  fmt::format_to(sink, "              │    ││││\n");
  fmt::format_to(sink, "              │    └└└└── = {:016b}\n", result.uuid.clock_seq_bits());
  for (const auto &line : result.clock_sequence_lines) { fmt::format_to(sink, "              │             {}\n", line); }
  fmt::format_to(sink, "              └─────── = version {} ({})\n", result.version, result.version_description);

  auto prefix = "\n* ";
  for (const auto &note : result.timestamp_notes) {
    fmt::format_to(sink, "{}{}\n", prefix, note);
    prefix = "  ";
  }

  return fmt::to_string(out);
}

}// namespace uuid_autopsy::render
