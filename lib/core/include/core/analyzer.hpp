#pragma once

#include <concepts/clock_source.hpp>
#include <core/findings.hpp>
#include <core/parsed_uuid.hpp>
#include <platform/time_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>

namespace uuid_autopsy::core {

/**
 * @brief Decodes, classifies and explains UUIDs.
 *
 * Reads the clock exactly once per analysis. Stateless apart from the clock,
 * so one analyzer can serve any number of threads.
 *
 * @tparam Clock Type satisfying the clock_source concept
 */
template<concepts::clock_source Clock = platform::system_clock_source> class analyzer
{
public:
  analyzer() = default;

  explicit analyzer(Clock clock) : clock_(std::move(clock)) {}

  /**
   * @brief Analyzes a UUID given in canonical textual form.
   *
   * @param text UUID text (case-insensitive)
   * @return Findings for the UUID
   * @throws malformed_input if the text is not in canonical form
   */
  [[nodiscard]] auto analyze(std::string_view text) const -> findings
  {
    const auto uuid = parsed_uuid::parse(text);
    return analyze(uuid, std::string(text));
  }

  /**
   * @brief Analyzes an already decoded UUID.
   *
   * @param uuid Decoded UUID
   * @param input Original text; defaults to the canonical form
   */
  [[nodiscard]] auto analyze(const parsed_uuid &uuid, std::string input = {}) const -> findings
  {
    if (input.empty()) { input = uuid.to_string(); }
    auto result = assemble_findings(std::move(input), uuid, clock_.now());
    spdlog::debug("[analyzer] {} -> {} (variant {}, version {})",
      result.forms.canonical,
      name_of(result.outcome),
      to_string(result.variant),
      result.version);
    return result;
  }

private:
  Clock clock_{};
};

}// namespace uuid_autopsy::core
