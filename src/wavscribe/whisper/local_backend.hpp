#pragma once

#include "backend.hpp"

#include <string>

struct whisper_context;

// Runs whisper.cpp in-process. load() must succeed before transcribe().
class LocalBackend : public WhisperBackend {
public:
    LocalBackend();
    ~LocalBackend() override;

    LocalBackend(const LocalBackend&) = delete;
    LocalBackend& operator=(const LocalBackend&) = delete;

    std::expected<void, std::string> load(const std::string& model_path);

    std::expected<std::vector<TranscriptSegment>, std::string>
        transcribe(std::span<const float> audio, uint32_t sample_rate,
                   const DecodeConfig& config) override;

private:
    whisper_context* ctx_ = nullptr;
};
