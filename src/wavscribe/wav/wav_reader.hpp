#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace wav {

// Format descriptor exactly as stored in the container.
struct AudioFormat {
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    uint16_t bits_per_sample = 0;
};

// Interleaved samples, int16 for 16-bit PCM and float for 32-bit IEEE float.
using RawSamples = std::variant<std::vector<int16_t>, std::vector<float>>;

struct WavContents {
    AudioFormat format;
    RawSamples samples;
};

struct ContainerError {
    enum class Kind {
        Unreadable,         // missing file, not a WAV, or broken chunk structure
        UnsupportedFormat,  // readable, but not 16-bit PCM / 32-bit float, mono / stereo
    };

    Kind kind;
    std::string message;
};

// Parse a complete in-memory WAV image.
std::expected<WavContents, ContainerError> parse(std::span<const uint8_t> bytes);

// Read and decode a WAV file eagerly. Never modifies the file.
std::expected<WavContents, ContainerError> read(const std::string& path);

size_t sample_count(const RawSamples& samples);

} // namespace wav
