#include <core/findings.hpp>

#include <core/classifier.hpp>
#include <core/time_interpreter.hpp>
#include <fmt/format.h>
#include <utility>
#include <variant>

namespace uuid_autopsy::core {

namespace {

  auto variant_width(variant_kind kind) -> unsigned
  {
    switch (kind) {
    case variant_kind::ncs:
      return 1;
    case variant_kind::rfc_4122:
      return 2;
    case variant_kind::microsoft:
    case variant_kind::reserved:
      break;
    }
    return 3;
  }

  auto variant_pattern_line(variant_kind kind) -> std::string
  {
    switch (kind) {
    case variant_kind::ncs:
      return "0............... = NCS backward compatibility";
    case variant_kind::rfc_4122:
      return "10.............. = RFC 4122/DCE";
    case variant_kind::microsoft:
      return "110............. = Microsoft backward compatibility";
    case variant_kind::reserved:
      break;
    }
    return "111............. = reserved";
  }

  // Verdicts that vouch for the fields, including the timestamp.
  auto seems_conforming(const verdict &outcome) -> bool
  {
    return std::holds_alternative<valid>(outcome) or std::holds_alternative<microsoft_known_value>(outcome)
           or std::holds_alternative<nil_uuid>(outcome);
  }

}// namespace

auto describe_clock_sequence_bits(const parsed_uuid &uuid) -> std::vector<std::string>
{
  const auto variant = variant_of(uuid);
  std::vector<std::string> lines{ variant_pattern_line(variant) };

  if (variant == variant_kind::rfc_4122) {
    const auto clock_sequence = uuid.clock_sequence_value();
    lines.push_back(
      fmt::format("..{:014b} = {}", clock_sequence, describe_clock_sequence(uuid.version(), clock_sequence)));
  }
  return lines;
}

auto describe_timestamp(const parsed_uuid &uuid, std::chrono::system_clock::time_point now) -> std::vector<std::string>
{
  const auto timestamp = uuid.timestamp_value();
  std::vector<std::string> notes{
    fmt::format("{:015x} is {} in decimal. It represents", timestamp, timestamp),
    fmt::format("{}.{:01d} microseconds since {}.", timestamp / 10, timestamp % 10, platform::format_utc_seconds(uuid_epoch)),
  };

  if (uuid.version() != 1) {
    notes.emplace_back("This is meaningless as a timestamp except in a version 1 UUID.");
  } else if (not is_reasonable_time(timestamp, now)) {
    notes.emplace_back("This is an unlikely time for a UUID to have been generated");
    notes.push_back(fmt::format("because it lies outside the time window from {} to present.", earliest_year));
  }
  return notes;
}

auto field_layout(const parsed_uuid &uuid) -> std::vector<bit_field>
{
  constexpr unsigned clock_seq_width = 16;
  constexpr std::uint16_t time_hi_mask = 0x0FFF;

  const auto width = variant_width(variant_of(uuid));
  const auto clock_bits = uuid.clock_seq_bits();
  const auto remaining = clock_seq_width - width;

  return {
    bit_field{ .name = "time_low", .first_bit = 0, .width = 32, .value = uuid.time_low() },
    bit_field{ .name = "time_mid", .first_bit = 32, .width = 16, .value = uuid.time_mid() },
    bit_field{ .name = "version", .first_bit = 48, .width = 4, .value = uuid.version() },
    bit_field{ .name = "time_hi", .first_bit = 52, .width = 12, .value = static_cast<std::uint64_t>(uuid.time_hi_and_version() & time_hi_mask) },
    bit_field{ .name = "variant", .first_bit = 64, .width = width, .value = static_cast<std::uint64_t>(clock_bits >> remaining) },
    bit_field{ .name = "clock_seq",
      .first_bit = 64 + width,
      .width = remaining,
      .value = static_cast<std::uint64_t>(clock_bits & ((1U << remaining) - 1U)) },
    bit_field{ .name = "node", .first_bit = 80, .width = 48, .value = uuid.node() },
  };
}

auto assemble_findings(std::string input, const parsed_uuid &uuid, std::chrono::system_clock::time_point now)
  -> findings
{
  auto outcome = classify(uuid, now);
  const auto time = calendar_time(uuid.timestamp_value());
  const bool meaningful = uuid.version() == 1 and seems_conforming(outcome);
  const auto summary = std::string(summary_of(outcome));
  const auto time_description = fmt::format("{} {}", meaningful ? "=" : "≍", platform::format_utc(time));
  auto clock_lines = describe_clock_sequence_bits(uuid);
  auto notes = describe_timestamp(uuid, now);

  return findings{ .input = std::move(input),
    .uuid = uuid,
    .timestamp = uuid.timestamp_value(),
    .clock_sequence = uuid.clock_sequence_value(),
    .variant_bits = uuid.variant_bits(),
    .version = uuid.version(),
    .variant = variant_of(uuid),
    .version_class = version_of(uuid),
    .variant_description = std::string(describe_variant(variant_of(uuid))),
    .version_description = std::string(describe_version(version_of(uuid))),
    .outcome = outcome,
    .summary = summary,
    .time = time,
    .time_description = time_description,
    .time_is_meaningful = meaningful,
    .clock_sequence_lines = std::move(clock_lines),
    .timestamp_notes = std::move(notes),
    .layout = field_layout(uuid),
    .forms = textual_forms{ .canonical = uuid.to_string(),
      .guid = uuid.to_guid(),
      .urn = uuid.to_urn(),
      .oid = uuid.to_oid(),
      .integer = uuid.to_integer_string() } };
}

}// namespace uuid_autopsy::core
