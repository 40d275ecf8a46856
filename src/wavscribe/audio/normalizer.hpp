#pragma once

#include "wav/wav_reader.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

struct FormatError {
    enum class Kind { UnsupportedBitDepth, UnsupportedChannelCount, SampleTypeMismatch };

    Kind kind;
    std::string message;
};

// Converts raw interleaved samples to mono float32 in [-1, 1].
// One output sample per complete frame; a trailing partial frame is dropped.
std::expected<std::vector<float>, FormatError>
normalize(const wav::AudioFormat& format, const wav::RawSamples& samples);

// Non-fatal: returns a warning when the source rate differs from what the engine expects.
std::optional<std::string> sample_rate_warning(const wav::AudioFormat& format,
                                               uint32_t expected_rate);
