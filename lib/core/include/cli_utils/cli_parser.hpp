#pragma once

#include <CLI/CLI.hpp>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

#include "internal_use_only/config.hpp"

namespace uuid_autopsy::cli_utils {

struct cli_args
{
  std::vector<std::string> uuids;
  std::string format = "report";
  bool verbose = false;
  bool show_version = false;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_option("uuid", args.uuids, "UUIDs to analyze; read one per line from stdin when omitted");
  app.add_option("-f,--format", args.format, "output format: report, json, canonical, guid, urn, oid, integer")
    ->check(CLI::IsMember({ "report", "json", "canonical", "guid", "urn", "oid", "integer" }));
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");
}

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "UUID Autopsy - forensic analysis of RFC 4122 UUIDs", std::string(cmake::project_name) };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  return args;
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (args.format != "report" and args.format != "json" and args.format != "canonical" and args.format != "guid"
      and args.format != "urn" and args.format != "oid" and args.format != "integer") {
    spdlog::error("Invalid format: {}", args.format);
    return false;
  }

  for (const auto &uuid : args.uuids) {
    if (uuid.empty()) {
      spdlog::error("Empty UUID argument");
      return false;
    }
  }

  return true;
}

}// namespace uuid_autopsy::cli_utils
