#include "report/transcript_formatter.hpp"

#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace report {

namespace {

double seconds(std::chrono::milliseconds ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

std::string trimmed(const std::string& text) {
    auto start_pos = text.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = text.find_last_not_of(" \t\n\r");
    return text.substr(start_pos, end_pos - start_pos + 1);
}

// HH:MM:SS,mmm
std::string srt_timestamp(std::chrono::milliseconds ms) {
    auto total = ms.count() < 0 ? 0 : ms.count();
    return std::format("{:02}:{:02}:{:02},{:03}",
                       total / 3600000, (total / 60000) % 60, (total / 1000) % 60, total % 1000);
}

} // namespace

std::optional<OutputFormat> parse_output_format(const std::string& name) {
    if (name == "text") return OutputFormat::Text;
    if (name == "json") return OutputFormat::Json;
    if (name == "srt") return OutputFormat::Srt;
    return std::nullopt;
}

std::string format_segment(const TranscriptSegment& segment) {
    return std::format("[{:.2f}s - {:.2f}s]: {}",
                       seconds(segment.start), seconds(segment.end), trimmed(segment.text));
}

std::string format_text(const std::vector<TranscriptSegment>& segments) {
    std::string out;
    for (const auto& s : segments) {
        out += format_segment(s);
        out += '\n';
    }
    return out;
}

std::string format_json(const std::vector<TranscriptSegment>& segments) {
    json j = {{"segments", json::array()}};
    std::string full_text;
    for (const auto& s : segments) {
        auto text = trimmed(s.text);
        j["segments"].push_back({
            {"start", seconds(s.start)},
            {"end", seconds(s.end)},
            {"text", text},
        });
        if (!text.empty()) {
            if (!full_text.empty()) full_text += ' ';
            full_text += text;
        }
    }
    j["text"] = full_text;
    return j.dump(2) + "\n";
}

std::string format_srt(const std::vector<TranscriptSegment>& segments) {
    std::string out;
    int index = 1;
    for (const auto& s : segments) {
        out += std::format("{}\n{} --> {}\n{}\n\n",
                           index++, srt_timestamp(s.start), srt_timestamp(s.end), trimmed(s.text));
    }
    return out;
}

std::string render(const std::vector<TranscriptSegment>& segments, OutputFormat format) {
    switch (format) {
        case OutputFormat::Text: return format_text(segments);
        case OutputFormat::Json: return format_json(segments);
        case OutputFormat::Srt: return format_srt(segments);
    }
    return format_text(segments);
}

} // namespace report
