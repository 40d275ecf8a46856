#pragma once

#include "whisper/backend.hpp"

#include <optional>
#include <string>
#include <vector>

namespace report {

enum class OutputFormat { Text, Json, Srt };

std::optional<OutputFormat> parse_output_format(const std::string& name);

// "[1.20s - 3.45s]: text"
std::string format_segment(const TranscriptSegment& segment);

std::string format_text(const std::vector<TranscriptSegment>& segments);
std::string format_json(const std::vector<TranscriptSegment>& segments);
std::string format_srt(const std::vector<TranscriptSegment>& segments);

std::string render(const std::vector<TranscriptSegment>& segments, OutputFormat format);

} // namespace report
