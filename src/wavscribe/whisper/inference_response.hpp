#pragma once

#include "whisper/backend.hpp"

#include <expected>
#include <string>
#include <vector>

// Parses a verbose_json transcription response (whisper.cpp server or OpenAI API).
// A response carrying only "text" yields one segment spanning the whole audio.
std::expected<std::vector<TranscriptSegment>, std::string>
parse_inference_response(const std::string& body, double audio_duration_s);
