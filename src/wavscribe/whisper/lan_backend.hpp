#pragma once

#include "backend.hpp"

#include <string>

// Sends audio to a whisper.cpp server or an OpenAI-compatible endpoint.
class LanBackend : public WhisperBackend {
public:
    // api_format: "whisper.cpp" or "openai"
    LanBackend(std::string url, std::string api_format = "whisper.cpp");
    ~LanBackend() override;

    std::expected<std::vector<TranscriptSegment>, std::string>
        transcribe(std::span<const float> audio, uint32_t sample_rate,
                   const DecodeConfig& config) override;

private:
    std::string url_;
    std::string api_format_;
};
