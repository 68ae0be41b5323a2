#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/analyzer.hpp>
#include <core/classifier.hpp>
#include <core/parsed_uuid.hpp>
#include <platform/time_utils.hpp>
#include <render/json_report.hpp>
#include <render/text_report.hpp>

namespace uuid_autopsy::core::test {

TEST_CASE("UUID analysis performance benchmarks", "[benchmark][analysis]")
{
  constexpr auto time_based = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";
  const analyzer<platform::system_clock_source> subject{};

  SECTION("Decoding")
  {
    BENCHMARK("Parse canonical text") { return parsed_uuid::parse(time_based); };

    BENCHMARK("Reject malformed text") { return parsed_uuid::try_parse("not-a-uuid"); };
  }

  SECTION("Classification")
  {
    const auto uuid = parsed_uuid::parse(time_based);
    const auto now = std::chrono::system_clock::now();

    BENCHMARK("Classify version 1 UUID") { return classify(uuid, now); };
  }

  SECTION("Full analysis")
  {
    BENCHMARK("Analyze to findings") { return subject.analyze(time_based); };

    const auto result = subject.analyze(time_based);

    BENCHMARK("Render text report") { return render::render_text(result); };

    BENCHMARK("Render JSON report") { return render::to_json(result).dump(); };
  }
}

}// namespace uuid_autopsy::core::test
