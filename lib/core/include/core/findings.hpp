#pragma once

#include <chrono>
#include <core/parsed_uuid.hpp>
#include <core/uuid_kinds.hpp>
#include <core/verdict.hpp>
#include <cstdint>
#include <platform/time_utils.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace uuid_autopsy::core {

/**
 * @brief One logical field of the 128-bit layout.
 *
 * Bits are numbered from 0 at the most significant bit of the first group.
 */
struct bit_field
{
  std::string_view name;
  unsigned first_bit;
  unsigned width;
  std::uint64_t value;
};

struct textual_forms
{
  std::string canonical;
  std::string guid;
  std::string urn;
  std::string oid;
  std::string integer;
};

/**
 * @brief Everything a renderer needs to explain one UUID.
 *
 * Built by assemble_findings(); holds no reference to any output format.
 */
struct findings
{
  std::string input;
  parsed_uuid uuid;

  std::uint64_t timestamp;
  std::uint16_t clock_sequence;
  std::uint8_t variant_bits;
  std::uint8_t version;

  variant_kind variant;
  version_kind version_class;
  std::string variant_description;
  std::string version_description;

  verdict outcome;
  std::string summary;

  platform::hundred_ns_time time;
  std::string time_description;
  bool time_is_meaningful;

  std::vector<std::string> clock_sequence_lines;
  std::vector<std::string> timestamp_notes;
  std::vector<bit_field> layout;
  textual_forms forms;
};

/**
 * @brief Bit-pattern lines explaining the fourth group.
 *
 * The first line names the variant; under RFC 4122 a second line gives the
 * 14 clock sequence bits and what they hold for this version.
 */
[[nodiscard]] auto describe_clock_sequence_bits(const parsed_uuid &uuid) -> std::vector<std::string>;

/**
 * @brief Footnote lines about the timestamp and whether it can be trusted.
 *
 * Version 1 timestamps outside the window from 1990 to @p now plus an hour
 * are flagged as unlikely, whatever the variant.
 */
[[nodiscard]] auto describe_timestamp(const parsed_uuid &uuid, std::chrono::system_clock::time_point now)
  -> std::vector<std::string>;

[[nodiscard]] auto field_layout(const parsed_uuid &uuid) -> std::vector<bit_field>;

/**
 * @brief Classifies a decoded UUID and gathers the results into a findings record.
 *
 * @param input Text the UUID was decoded from, kept verbatim
 * @param uuid Decoded UUID
 * @param now Analysis time
 */
[[nodiscard]] auto assemble_findings(std::string input, const parsed_uuid &uuid, std::chrono::system_clock::time_point now)
  -> findings;

}// namespace uuid_autopsy::core
