#include <core/analyzer.hpp>
#include <core/parsed_uuid.hpp>
#include <cstddef>
#include <cstdint>
#include <platform/time_utils.hpp>
#include <render/json_report.hpp>
#include <render/text_report.hpp>
#include <stdexcept>
#include <string>
#include <tuple>

// Fuzzer that feeds arbitrary text to the decoder and, when it decodes, through the full analysis and renderers
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string input(reinterpret_cast<const char *>(Data), Size);

  const auto uuid = uuid_autopsy::core::parsed_uuid::try_parse(input);
  if (not uuid) { return 0; }

  if (uuid_autopsy::core::parsed_uuid::parse(uuid->to_string()) != *uuid) {
    throw std::logic_error("canonical form does not decode to the same UUID");
  }

  const uuid_autopsy::core::analyzer<uuid_autopsy::platform::system_clock_source> analyzer{};
  const auto result = analyzer.analyze(*uuid, input);

  std::ignore = uuid_autopsy::render::render_text(result);
  std::ignore = uuid_autopsy::render::to_json(result).dump();

  return 0;
}
