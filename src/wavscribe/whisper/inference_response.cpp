#include "whisper/inference_response.hpp"

#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string trim(const std::string& text) {
    auto start_pos = text.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = text.find_last_not_of(" \t\n\r");
    return text.substr(start_pos, end_pos - start_pos + 1);
}

std::chrono::milliseconds to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

} // namespace

std::expected<std::vector<TranscriptSegment>, std::string>
parse_inference_response(const std::string& body, double audio_duration_s) {
    try {
        auto j = json::parse(body);
        if (!j.is_object()) {
            return std::unexpected("unexpected response: " + body);
        }

        if (j.contains("error")) {
            const auto& e = j["error"];
            if (e.is_object() && e.contains("message")) {
                return std::unexpected("server error: " + e["message"].get<std::string>());
            }
            return std::unexpected("server error: " + (e.is_string() ? e.get<std::string>() : e.dump()));
        }

        std::vector<TranscriptSegment> segments;

        if (j.contains("segments") && j["segments"].is_array()) {
            for (const auto& s : j["segments"]) {
                segments.push_back(TranscriptSegment{
                    .start = to_ms(s.value("start", 0.0)),
                    .end = to_ms(s.value("end", 0.0)),
                    .text = trim(s.value("text", "")),
                });
            }
            std::stable_sort(segments.begin(), segments.end(),
                             [](const TranscriptSegment& a, const TranscriptSegment& b) {
                                 return a.start < b.start;
                             });
            return segments;
        }

        if (j.contains("text")) {
            auto text = trim(j["text"].get<std::string>());
            if (!text.empty()) {
                segments.push_back(TranscriptSegment{
                    .start = std::chrono::milliseconds(0),
                    .end = to_ms(audio_duration_s),
                    .text = std::move(text),
                });
            }
            return segments;
        }

        return std::unexpected("unexpected response: " + body);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
