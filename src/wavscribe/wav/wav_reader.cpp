#include "wav/wav_reader.hpp"

#include <cstring>
#include <format>
#include <fstream>
#include <iterator>

namespace wav {

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

struct FmtChunk {
    uint16_t format_tag = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint32_t byte_rate = 0;
    uint16_t block_align = 0;
    uint16_t bits_per_sample = 0;
};

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

std::unexpected<ContainerError> unreadable(std::string msg) {
    return std::unexpected(ContainerError{ContainerError::Kind::Unreadable, std::move(msg)});
}

std::unexpected<ContainerError> unsupported(std::string msg) {
    return std::unexpected(ContainerError{ContainerError::Kind::UnsupportedFormat, std::move(msg)});
}

std::expected<FmtChunk, ContainerError> parse_fmt(const uint8_t* body, uint32_t size) {
    if (size < 16) {
        return unreadable(std::format("fmt chunk too short ({} bytes)", size));
    }

    FmtChunk fmt;
    fmt.format_tag = read_u16(body);
    fmt.channels = read_u16(body + 2);
    fmt.sample_rate = read_u32(body + 4);
    fmt.byte_rate = read_u32(body + 8);
    fmt.block_align = read_u16(body + 12);
    fmt.bits_per_sample = read_u16(body + 14);

    if (fmt.format_tag == kFormatExtensible) {
        // cbSize(2) validBits(2) channelMask(4), then the sub-format GUID
        if (size < 40) {
            return unreadable(std::format("extensible fmt chunk too short ({} bytes)", size));
        }
        fmt.format_tag = read_u16(body + 24);
    }

    if (fmt.channels == 0) return unreadable("fmt chunk declares zero channels");
    if (fmt.sample_rate == 0) return unreadable("fmt chunk declares a zero sample rate");
    if (fmt.bits_per_sample == 0) return unreadable("fmt chunk declares zero bits per sample");

    return fmt;
}

std::expected<void, ContainerError> check_supported(const FmtChunk& fmt) {
    bool pcm16 = fmt.format_tag == kFormatPcm && fmt.bits_per_sample == 16;
    bool float32 = fmt.format_tag == kFormatFloat && fmt.bits_per_sample == 32;
    if (!pcm16 && !float32) {
        return unsupported(std::format("unsupported sample encoding: format={} bits={}",
                                       fmt.format_tag, fmt.bits_per_sample));
    }
    if (fmt.channels > 2) {
        return unsupported(std::format("unsupported channel count: {}", fmt.channels));
    }
    if (fmt.block_align != fmt.channels * fmt.bits_per_sample / 8) {
        return unreadable(std::format("block align {} does not match {} channel(s) of {} bits",
                                      fmt.block_align, fmt.channels, fmt.bits_per_sample));
    }
    return {};
}

template <typename T>
std::vector<T> decode(const uint8_t* body, uint32_t size) {
    std::vector<T> out(size / sizeof(T));
    if (!out.empty()) {
        std::memcpy(out.data(), body, out.size() * sizeof(T));
    }
    return out;
}

} // namespace

std::expected<WavContents, ContainerError> parse(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12) {
        return unreadable(std::format("{} bytes is too short for a RIFF header", bytes.size()));
    }
    if (!tag_is(bytes.data(), "RIFF") || !tag_is(bytes.data() + 8, "WAVE")) {
        return unreadable("missing RIFF/WAVE signature");
    }

    // Scan chunks (don't assume a 44-byte header)
    bool found_fmt = false;
    FmtChunk fmt;
    size_t pos = 12;

    while (pos + 8 <= bytes.size()) {
        const uint8_t* header = bytes.data() + pos;
        uint32_t chunk_size = read_u32(header + 4);
        size_t body_pos = pos + 8;
        size_t remaining = bytes.size() - body_pos;

        if (tag_is(header, "fmt ")) {
            if (chunk_size > remaining) {
                return unreadable("fmt chunk runs past end of file");
            }
            auto parsed = parse_fmt(bytes.data() + body_pos, chunk_size);
            if (!parsed) return std::unexpected(parsed.error());
            fmt = *parsed;
            found_fmt = true;

        } else if (tag_is(header, "data")) {
            if (!found_fmt) {
                return unreadable("data chunk before fmt chunk");
            }
            if (auto ok = check_supported(fmt); !ok) {
                return std::unexpected(ok.error());
            }
            if (chunk_size > remaining) {
                return unreadable(std::format("data chunk declares {} bytes but only {} remain",
                                              chunk_size, remaining));
            }
            if (chunk_size % fmt.block_align != 0) {
                return unreadable(std::format("data length {} is not a multiple of block align {}",
                                              chunk_size, fmt.block_align));
            }

            const uint8_t* body = bytes.data() + body_pos;
            WavContents contents{
                .format = AudioFormat{
                    .sample_rate = fmt.sample_rate,
                    .channels = fmt.channels,
                    .bits_per_sample = fmt.bits_per_sample,
                },
                .samples = {},
            };
            if (fmt.bits_per_sample == 16) {
                contents.samples = decode<int16_t>(body, chunk_size);
            } else {
                contents.samples = decode<float>(body, chunk_size);
            }
            return contents;
        }

        // Chunks are word-aligned
        pos = body_pos + static_cast<size_t>(chunk_size) + (chunk_size & 1u);
    }

    if (!found_fmt) return unreadable("missing fmt chunk");
    return unreadable("missing data chunk");
}

std::expected<WavContents, ContainerError> read(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unreadable("cannot open " + path);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) {
        return unreadable("I/O error while reading " + path);
    }

    auto contents = parse(bytes);
    if (!contents) {
        auto err = contents.error();
        err.message = path + ": " + err.message;
        return std::unexpected(std::move(err));
    }
    return contents;
}

size_t sample_count(const RawSamples& samples) {
    return std::visit([](const auto& v) { return v.size(); }, samples);
}

} // namespace wav
