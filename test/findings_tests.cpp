#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <core/analyzer.hpp>
#include <core/findings.hpp>
#include <core/parsed_uuid.hpp>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include "test_doubles/test_double_clock.hpp"

using uuid_autopsy::core::analyzer;
using uuid_autopsy::core::bit_field;
using uuid_autopsy::core::malformed_input;
using uuid_autopsy::core::parsed_uuid;
using uuid_autopsy::core::variant_kind;
using uuid_autopsy::core::version_kind;
using uuid_autopsy_test::test_double_clock;

TEST_CASE("analyzer assembles findings for a version 1 UUID", "[findings][analyzer]")
{
  const analyzer<test_double_clock> subject{ test_double_clock{} };
  const auto result = subject.analyze("6BA7B810-9DAD-11D1-80B4-00C04FD430C8");

  CHECK(result.input == "6BA7B810-9DAD-11D1-80B4-00C04FD430C8");
  CHECK(result.forms.canonical == "6ba7b810-9dad-11d1-80b4-00c04fd430c8");
  CHECK(result.forms.guid == "{6BA7B810-9DAD-11D1-80B4-00C04FD430C8}");
  CHECK(result.forms.urn == "urn:uuid:6ba7b810-9dad-11d1-80b4-00c04fd430c8");
  CHECK(result.forms.oid == "2.25.143098242404177361603877621312831893704");

  CHECK(result.timestamp == 131059232331511824ULL);
  CHECK(result.clock_sequence == 180);
  CHECK(result.variant_bits == 0b100);
  CHECK(result.version == 1);
  CHECK(result.variant == variant_kind::rfc_4122);
  CHECK(result.version_class == version_kind::time_based);
  CHECK(result.variant_description == "10x = RFC 4122/DCE");
  CHECK(result.version_description == "RFC 4122/DCE, time-based");

  CHECK(result.summary == "This seems like a UUID generated according to RFC 4122 or DCE.");
  CHECK(result.time_is_meaningful);
  CHECK(result.time_description == "= 1998-02-04 22:13:53.1511824 UTC");

  CHECK(result.clock_sequence_lines
        == std::vector<std::string>{ "10.............. = RFC 4122/DCE", "..00000010110100 = 180 (clock sequence value)" });
  CHECK(result.timestamp_notes
        == std::vector<std::string>{ "1d19dad6ba7b810 is 131059232331511824 in decimal. It represents",
          "13105923233151182.4 microseconds since 1582-10-15 00:00:00 UTC." });
}

TEST_CASE("analyzer reads the clock once per analysis", "[findings][analyzer]")
{
  const test_double_clock clock;
  const analyzer<test_double_clock> subject{ clock };

  std::ignore = subject.analyze("f47ac10b-58cc-4372-a567-0e02b2c3d479");
  CHECK(clock.reads() == 1);

  std::ignore = subject.analyze(parsed_uuid::parse("886313e1-3b8a-5372-9b90-0c9aee199e5d"));
  CHECK(clock.reads() == 2);
}

TEST_CASE("analyzer propagates malformed input", "[findings][analyzer][errors]")
{
  const test_double_clock clock;
  const analyzer<test_double_clock> subject{ clock };

  CHECK_THROWS_AS(subject.analyze("not-a-uuid"), malformed_input);
  CHECK(clock.reads() == 0);
}

TEST_CASE("findings summarize each verdict", "[findings][summary]")
{
  const analyzer<test_double_clock> subject{ test_double_clock{} };

  CHECK(subject.analyze("00000000-0000-0000-0000-000000000000").summary
        == "This UUID is specifically defined by RFC 4122 as the \"nil\" UUID.");
  CHECK(subject.analyze("00000000-0000-0000-c000-000000000046").summary == "This seems like a UUID from Microsoft.");
  CHECK(subject.analyze("00000000-0000-0000-c000-000000000047").summary
        == "This doesn't seem like a UUID generated according to RFC 4122.");
  CHECK(subject.analyze("12345678-1234-9234-8234-123456789abc").summary
        == "This is DEFINITELY NOT a UUID generated according to RFC 4122.");
  CHECK(subject.analyze("13814000-1dd2-11b2-8123-0123456789ab").summary
        == "This is DEFINITELY NOT a UUID generated according to RFC 4122.");
  CHECK(subject.analyze("000003e8-92e8-21ed-8100-325096b39f47").summary
        == "This seems like a UUID generated according to DCE Security.");
  CHECK(subject.analyze("6fa459ea-ee8a-3ca4-894e-db77e160355e").summary
        == "This seems like a UUID generated according to RFC 4122.");
  CHECK(subject.analyze("f47ac10b-58cc-4372-a567-0e02b2c3d479").summary
        == "This seems like a UUID generated according to RFC 4122.");
  CHECK(subject.analyze("886313e1-3b8a-5372-9b90-0c9aee199e5d").summary
        == "This seems like a UUID generated according to RFC 4122.");
  CHECK(subject.analyze("f47ac10b-58cc-4372-e567-0e02b2c3d479").summary
        == "This doesn't seem like a UUID generated according to RFC 4122.");
}

TEST_CASE("findings describe the clock sequence by variant and version", "[findings][clock_sequence]")
{
  using uuid_autopsy::core::describe_clock_sequence_bits;

  CHECK(describe_clock_sequence_bits(parsed_uuid::parse("f47ac10b-58cc-4372-a567-0e02b2c3d479"))
        == std::vector<std::string>{ "10.............. = RFC 4122/DCE", "..10010101100111 = random bits" });
  CHECK(describe_clock_sequence_bits(parsed_uuid::parse("6fa459ea-ee8a-3ca4-894e-db77e160355e"))
        == std::vector<std::string>{ "10.............. = RFC 4122/DCE", "..00100101001110 = MD5 hash bits 66-95" });
  CHECK(describe_clock_sequence_bits(parsed_uuid::parse("886313e1-3b8a-5372-9b90-0c9aee199e5d"))
        == std::vector<std::string>{ "10.............. = RFC 4122/DCE", "..01101110010000 = SHA-1 hash bits 66-95" });
  CHECK(describe_clock_sequence_bits(parsed_uuid::parse("000003e8-92e8-21ed-8100-325096b39f47"))
        == std::vector<std::string>{ "10.............. = RFC 4122/DCE", "..00000100000000 = 256 (???)" });
  CHECK(describe_clock_sequence_bits(parsed_uuid::parse("12345678-1234-9234-8234-123456789abc"))
        == std::vector<std::string>{ "10.............. = RFC 4122/DCE", "..00001000110100 = 564 (???)" });

  SECTION("non-RFC variants only name the variant")
  {
    CHECK(describe_clock_sequence_bits(parsed_uuid::parse("00000000-0000-0000-0000-000000000000"))
          == std::vector<std::string>{ "0............... = NCS backward compatibility" });
    CHECK(describe_clock_sequence_bits(parsed_uuid::parse("00000000-0000-0000-c000-000000000046"))
          == std::vector<std::string>{ "110............. = Microsoft backward compatibility" });
    CHECK(describe_clock_sequence_bits(parsed_uuid::parse("ffffffff-ffff-ffff-ffff-ffffffffffff"))
          == std::vector<std::string>{ "111............. = reserved" });
  }
}

TEST_CASE("findings flag timestamps that are not trustworthy", "[findings][time]")
{
  const analyzer<test_double_clock> subject{ test_double_clock{} };

  SECTION("other versions carry coincidental timestamps")
  {
    const auto result = subject.analyze("f47ac10b-58cc-4372-a567-0e02b2c3d479");
    CHECK_FALSE(result.time_is_meaningful);
    CHECK(result.time_description.starts_with("≍ "));
    REQUIRE(result.timestamp_notes.size() == 3);
    CHECK(result.timestamp_notes[2] == "This is meaningless as a timestamp except in a version 1 UUID.");
  }

  SECTION("version 1 outside the window")
  {
    const auto result = subject.analyze("13814000-1dd2-11b2-8123-0123456789ab");
    CHECK_FALSE(result.time_is_meaningful);
    CHECK(result.time_description == "≍ 1970-01-01 00:00:00.0000000 UTC");
    REQUIRE(result.timestamp_notes.size() == 4);
    CHECK(result.timestamp_notes[2] == "This is an unlikely time for a UUID to have been generated");
    CHECK(result.timestamp_notes[3] == "because it lies outside the time window from 1990 to present.");
  }

  SECTION("version 1 inside the window gets no warning")
  {
    const auto result = subject.analyze("6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    CHECK(result.time_description == "= 1998-02-04 22:13:53.1511824 UTC");
    CHECK(result.timestamp_notes.size() == 2);
  }

  SECTION("version 1 nibble under a foreign variant is judged by its time alone")
  {
    for (const auto *text : { "6ba7b810-9dad-11d1-00b4-00c04fd430c8",
           "6ba7b810-9dad-11d1-c0b4-00c04fd430c8",
           "6ba7b810-9dad-11d1-e0b4-00c04fd430c8" }) {
      CAPTURE(text);
      const auto result = subject.analyze(text);
      CHECK(result.summary == "This doesn't seem like a UUID generated according to RFC 4122.");
      CHECK(result.time_description == "≍ 1998-02-04 22:13:53.1511824 UTC");
      CHECK(result.timestamp_notes.size() == 2);
    }

    const auto ancient = subject.analyze("13814000-1dd2-11b2-0123-0123456789ab");
    REQUIRE(ancient.timestamp_notes.size() == 4);
    CHECK(ancient.timestamp_notes[2] == "This is an unlikely time for a UUID to have been generated");
  }

  SECTION("the known Microsoft value with a version 1 nibble keeps an exact time")
  {
    const auto result = subject.analyze("00000000-0000-1000-c000-000000000046");
    CHECK(result.summary == "This seems like a UUID from Microsoft.");
    CHECK(result.time_is_meaningful);
    CHECK(result.time_description == "= 1582-10-15 00:00:00.0000000 UTC");
    REQUIRE(result.timestamp_notes.size() == 4);
    CHECK(result.timestamp_notes[3] == "because it lies outside the time window from 1990 to present.");
  }
}

TEST_CASE("describe_timestamp judges the window against the supplied time", "[findings][time]")
{
  using namespace std::chrono;
  const auto uuid = parsed_uuid::parse("6ba7b810-9dad-11d1-00b4-00c04fd430c8");

  CHECK(uuid_autopsy::core::describe_timestamp(uuid, sys_days{ 2024y / January / 1 }).size() == 2);
  CHECK(uuid_autopsy::core::describe_timestamp(uuid, sys_days{ 1997y / January / 1 }).size() == 4);
}

TEST_CASE("findings lay out the 128 bits by field", "[findings][layout]")
{
  const auto field_named = [](const std::vector<bit_field> &layout, std::string_view name) {
    for (const auto &field : layout) {
      if (field.name == name) { return field; }
    }
    FAIL("missing field " << name);
    return bit_field{};
  };

  SECTION("fields tile the whole value")
  {
    const auto layout = uuid_autopsy::core::field_layout(parsed_uuid::parse("6ba7b810-9dad-11d1-80b4-00c04fd430c8"));
    unsigned next_bit = 0;
    for (const auto &field : layout) {
      CHECK(field.first_bit == next_bit);
      next_bit += field.width;
    }
    CHECK(next_bit == 128);

    CHECK(field_named(layout, "time_low").value == 0x6ba7b810U);
    CHECK(field_named(layout, "version").value == 1U);
    CHECK(field_named(layout, "time_hi").value == 0x1d1U);
    CHECK(field_named(layout, "variant").value == 0b10U);
    CHECK(field_named(layout, "variant").width == 2U);
    CHECK(field_named(layout, "clock_seq").value == 180U);
    CHECK(field_named(layout, "node").value == 0x00c04fd430c8ULL);
  }

  SECTION("variant width follows the variant")
  {
    const auto ncs = uuid_autopsy::core::field_layout(parsed_uuid::parse("00000000-0000-0000-7fff-000000000000"));
    CHECK(field_named(ncs, "variant").width == 1U);
    CHECK(field_named(ncs, "clock_seq").value == 0x7fffU);

    const auto microsoft = uuid_autopsy::core::field_layout(parsed_uuid::parse("00000000-0000-0000-c000-000000000046"));
    CHECK(field_named(microsoft, "variant").width == 3U);
    CHECK(field_named(microsoft, "variant").value == 0b110U);
  }
}
