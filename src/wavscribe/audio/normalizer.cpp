#include "audio/normalizer.hpp"

#include <format>

namespace {

constexpr float kInt16Scale = 32768.0f;

std::vector<float> from_int16(const std::vector<int16_t>& in, uint16_t channels) {
    std::vector<float> out;
    if (channels == 1) {
        out.reserve(in.size());
        for (int16_t s : in) {
            out.push_back(static_cast<float>(s) / kInt16Scale);
        }
        return out;
    }

    size_t frames = in.size() / 2;
    out.reserve(frames);
    for (size_t i = 0; i < frames; ++i) {
        float left = static_cast<float>(in[2 * i]) / kInt16Scale;
        float right = static_cast<float>(in[2 * i + 1]) / kInt16Scale;
        out.push_back((left + right) / 2.0f);
    }
    return out;
}

std::vector<float> from_float(const std::vector<float>& in, uint16_t channels) {
    if (channels == 1) return in;

    size_t frames = in.size() / 2;
    std::vector<float> out;
    out.reserve(frames);
    for (size_t i = 0; i < frames; ++i) {
        out.push_back((in[2 * i] + in[2 * i + 1]) / 2.0f);
    }
    return out;
}

} // namespace

std::expected<std::vector<float>, FormatError>
normalize(const wav::AudioFormat& format, const wav::RawSamples& samples) {
    if (format.bits_per_sample != 16 && format.bits_per_sample != 32) {
        return std::unexpected(FormatError{
            FormatError::Kind::UnsupportedBitDepth,
            std::format("unsupported bit depth: {}", format.bits_per_sample),
        });
    }
    if (format.channels != 1 && format.channels != 2) {
        return std::unexpected(FormatError{
            FormatError::Kind::UnsupportedChannelCount,
            std::format("unsupported channel count: {}", format.channels),
        });
    }

    if (format.bits_per_sample == 16) {
        if (auto* pcm = std::get_if<std::vector<int16_t>>(&samples)) {
            return from_int16(*pcm, format.channels);
        }
    } else {
        if (auto* pcm = std::get_if<std::vector<float>>(&samples)) {
            return from_float(*pcm, format.channels);
        }
    }

    return std::unexpected(FormatError{
        FormatError::Kind::SampleTypeMismatch,
        std::format("sample data does not match declared {}-bit format", format.bits_per_sample),
    });
}

std::optional<std::string> sample_rate_warning(const wav::AudioFormat& format,
                                               uint32_t expected_rate) {
    if (format.sample_rate == expected_rate) return std::nullopt;
    return std::format("engine works best with {}Hz audio, input is {}Hz "
                       "(no resampling is done, accuracy may suffer)",
                       expected_rate, format.sample_rate);
}
