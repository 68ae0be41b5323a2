#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/analyzer.hpp>
#include <core/default_printer.hpp>
#include <iostream>
#include <platform/time_utils.hpp>
#include <spdlog/spdlog.h>

namespace uuid_autopsy {

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = cli_utils::parse_cli_args(argc, argv);

  if (not cli_utils::validate_cli_args(args)) { return 1; }

  cli_utils::configure_logging(args);

  const core::analyzer<platform::system_clock_source> analyzer{};
  core::default_printer printer;

  if (args.uuids.empty() and not args.show_version) { spdlog::debug("No UUID arguments, reading from stdin"); }

  return cli_utils::run(args, std::cin, analyzer, printer);
}

}// namespace uuid_autopsy

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int { return uuid_autopsy::main(argc, argv); }
