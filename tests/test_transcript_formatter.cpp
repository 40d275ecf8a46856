#include <catch2/catch_test_macros.hpp>

#include "report/transcript_formatter.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

std::vector<TranscriptSegment> sample_segments() {
    return {
        {0ms, 1500ms, " Hello world."},
        {1500ms, 3250ms, " How are you?"},
    };
}

} // namespace

TEST_CASE("Transcript formatting", "[report]") {

    SECTION("SegmentLine") {
        TranscriptSegment seg{1200ms, 3450ms, " text"};
        REQUIRE(report::format_segment(seg) == "[1.20s - 3.45s]: text");
    }

    SECTION("TextKeepsEngineOrder") {
        REQUIRE(report::format_text(sample_segments()) ==
                "[0.00s - 1.50s]: Hello world.\n"
                "[1.50s - 3.25s]: How are you?\n");
    }

    SECTION("EmptyTranscript") {
        REQUIRE(report::format_text({}).empty());
        REQUIRE(report::format_srt({}).empty());
    }

    SECTION("Json") {
        auto j = nlohmann::json::parse(report::format_json(sample_segments()));
        REQUIRE(j["segments"].size() == 2);
        REQUIRE(j["segments"][0]["start"].get<double>() == 0.0);
        REQUIRE(j["segments"][1]["end"].get<double>() == 3.25);
        REQUIRE(j["segments"][1]["text"] == "How are you?");
        REQUIRE(j["text"] == "Hello world. How are you?");
    }

    SECTION("Srt") {
        std::vector<TranscriptSegment> segs = {
            {0ms, 1500ms, "Hello"},
            {3723004ms, 3725000ms, "later"},
        };
        REQUIRE(report::format_srt(segs) ==
                "1\n00:00:00,000 --> 00:00:01,500\nHello\n\n"
                "2\n01:02:03,004 --> 01:02:05,000\nlater\n\n");
    }

    SECTION("ParseOutputFormat") {
        REQUIRE(report::parse_output_format("text") == report::OutputFormat::Text);
        REQUIRE(report::parse_output_format("json") == report::OutputFormat::Json);
        REQUIRE(report::parse_output_format("srt") == report::OutputFormat::Srt);
        REQUIRE_FALSE(report::parse_output_format("vtt"));
    }

    SECTION("RenderDispatches") {
        auto segs = sample_segments();
        REQUIRE(report::render(segs, report::OutputFormat::Text) == report::format_text(segs));
        REQUIRE(report::render(segs, report::OutputFormat::Srt) == report::format_srt(segs));
    }
}
