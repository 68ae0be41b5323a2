#pragma once

#include <cli_utils/cli_parser.hpp>
#include <concepts/clock_source.hpp>
#include <concepts/printer.hpp>
#include <core/analyzer.hpp>
#include <core/parsed_uuid.hpp>
#include <fmt/core.h>
#include <istream>
#include <render/output_format.hpp>
#include <spdlog/spdlog.h>
#include <string>

#include "internal_use_only/config.hpp"

namespace uuid_autopsy::cli_utils {

inline auto configure_logging(const cli_args &args) -> void
{
  if (args.verbose) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::info);
  }
}

template<concepts::printer Printer> auto print_version(Printer &printer) -> void
{
  printer.print(fmt::format("{} v{}\n", cmake::project_name, cmake::project_version));
}

/**
 * @brief Analyzes one UUID and prints it in the requested format.
 *
 * @return false if the text is not a UUID; the problem is logged and nothing is printed
 */
template<concepts::printer Printer, concepts::clock_source Clock>
[[nodiscard]] auto analyze_one(const std::string &text,
  render::output_format format,
  const core::analyzer<Clock> &analyzer,
  Printer &printer) -> bool
{
  try {
    const auto result = analyzer.analyze(text);
    printer.print(render::render(result, format));
    return true;
  } catch (const core::malformed_input &e) {
    spdlog::error("{}", e.what());
    return false;
  }
}

/**
 * @brief Analyzes each positional UUID, or each non-blank stdin line when none were given.
 *
 * Reports between UUIDs are separated by a blank line in report format.
 *
 * @return Process exit code: 0 if every input was a UUID, 1 otherwise
 */
template<concepts::printer Printer, concepts::clock_source Clock>
[[nodiscard]] auto run(const cli_args &args, std::istream &input, const core::analyzer<Clock> &analyzer, Printer &printer)
  -> int
{
  if (args.show_version) {
    print_version(printer);
    return 0;
  }

  const auto format = render::parse_output_format(args.format).value_or(render::output_format::report);
  bool all_parsed = true;
  bool first = true;

  auto handle = [&](const std::string &text) {
    if (format == render::output_format::report and not first) { printer.print("\n"); }
    first = false;
    if (not analyze_one(text, format, analyzer, printer)) { all_parsed = false; }
  };

  if (not args.uuids.empty()) {
    for (const auto &text : args.uuids) { handle(text); }
  } else {
    std::string line;
    while (std::getline(input, line)) {
      if (not line.empty() and line.back() == '\r') { line.pop_back(); }
      if (line.empty()) { continue; }
      handle(line);
    }
  }

  return all_parsed ? 0 : 1;
}

}// namespace uuid_autopsy::cli_utils
