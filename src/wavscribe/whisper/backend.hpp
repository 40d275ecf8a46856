#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

struct TranscriptSegment {
    std::chrono::milliseconds start{0};
    std::chrono::milliseconds end{0};
    std::string text;
};

// Decoding parameters handed through to the engine untouched.
struct DecodeConfig {
    enum class Strategy { Greedy, BeamSearch };

    std::string language = "en";
    Strategy strategy = Strategy::BeamSearch;
    int beam_size = 1;
    float patience = -1.0f;
    int threads = 0; // 0 = engine default
    bool translate = false;
    bool print_progress = false;
    bool print_timestamps = true;
};

class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;

    // audio is mono float32 in [-1, 1]. Segments come back ordered by start time.
    virtual std::expected<std::vector<TranscriptSegment>, std::string>
        transcribe(std::span<const float> audio, uint32_t sample_rate,
                   const DecodeConfig& config) = 0;
};
