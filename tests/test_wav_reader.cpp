#include <catch2/catch_test_macros.hpp>

#include "wav/wav_encoder.hpp"
#include "wav/wav_reader.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

struct Chunk {
    std::string id;
    std::vector<uint8_t> body;
};

void put16(std::vector<uint8_t>& out, uint16_t v) {
    uint8_t b[2];
    std::memcpy(b, &v, 2);
    out.insert(out.end(), b, b + 2);
}

void put32(std::vector<uint8_t>& out, uint32_t v) {
    uint8_t b[4];
    std::memcpy(b, &v, 4);
    out.insert(out.end(), b, b + 4);
}

std::vector<uint8_t> fmt_body(uint16_t tag, uint16_t channels, uint32_t rate, uint16_t bits) {
    std::vector<uint8_t> body;
    put16(body, tag);
    put16(body, channels);
    put32(body, rate);
    put32(body, rate * channels * bits / 8);
    put16(body, static_cast<uint16_t>(channels * bits / 8));
    put16(body, bits);
    return body;
}

// Assemble a RIFF/WAVE image from chunks, padding odd-sized bodies.
std::vector<uint8_t> riff(const std::vector<Chunk>& chunks) {
    std::vector<uint8_t> payload;
    for (const auto& c : chunks) {
        payload.insert(payload.end(), c.id.begin(), c.id.end());
        put32(payload, static_cast<uint32_t>(c.body.size()));
        payload.insert(payload.end(), c.body.begin(), c.body.end());
        if (c.body.size() % 2) payload.push_back(0);
    }
    std::vector<uint8_t> out = {'R', 'I', 'F', 'F'};
    put32(out, static_cast<uint32_t>(payload.size() + 4));
    out.insert(out.end(), {'W', 'A', 'V', 'E'});
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

template <typename T>
std::vector<uint8_t> bytes_of(const std::vector<T>& v) {
    std::vector<uint8_t> out(v.size() * sizeof(T));
    std::memcpy(out.data(), v.data(), out.size());
    return out;
}

bool is_unreadable(const std::expected<wav::WavContents, wav::ContainerError>& r) {
    return !r && r.error().kind == wav::ContainerError::Kind::Unreadable;
}

bool is_unsupported(const std::expected<wav::WavContents, wav::ContainerError>& r) {
    return !r && r.error().kind == wav::ContainerError::Kind::UnsupportedFormat;
}

struct TmpDir {
    std::filesystem::path path;

    TmpDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "ws_test_wav_XXXXXX").string();
        path = ::mkdtemp(tmpl.data());
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

void write_file(const std::filesystem::path& p, const std::vector<uint8_t>& data) {
    std::ofstream f(p, std::ios::binary);
    f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

std::vector<uint8_t> read_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

} // namespace

TEST_CASE("wav::parse decodes supported formats", "[wav_reader]") {

    SECTION("MonoPcm16") {
        std::vector<int16_t> samples = {0, 16384, -16384, 32767, -32768};
        auto r = wav::parse(wav::encode(samples, 16000));
        REQUIRE(r);
        REQUIRE(r->format.sample_rate == 16000);
        REQUIRE(r->format.channels == 1);
        REQUIRE(r->format.bits_per_sample == 16);
        REQUIRE(std::get<std::vector<int16_t>>(r->samples) == samples);
    }

    SECTION("StereoFloat32") {
        std::vector<float> samples = {1.0f, -1.0f, 0.5f, 0.5f};
        auto r = wav::parse(wav::encode(samples, 48000, 2));
        REQUIRE(r);
        REQUIRE(r->format.channels == 2);
        REQUIRE(r->format.bits_per_sample == 32);
        REQUIRE(std::get<std::vector<float>>(r->samples) == samples);
        REQUIRE(wav::sample_count(r->samples) == 4);
    }

    SECTION("SkipsUnknownAndOddSizedChunks") {
        std::vector<int16_t> samples = {7, -7};
        auto image = riff({
            {"LIST", {'a', 'b', 'c'}},
            {"fmt ", fmt_body(1, 1, 16000, 16)},
            {"fact", {1, 0, 0, 0}},
            {"data", bytes_of(samples)},
        });
        auto r = wav::parse(image);
        REQUIRE(r);
        REQUIRE(std::get<std::vector<int16_t>>(r->samples) == samples);
    }

    SECTION("ExtensibleFloat") {
        auto fmt = fmt_body(0xFFFE, 1, 16000, 32);
        put16(fmt, 22);          // cbSize
        put16(fmt, 32);          // valid bits
        put32(fmt, 0x4);         // channel mask
        put16(fmt, 3);           // sub-format: IEEE float
        fmt.resize(40, 0);
        std::vector<float> samples = {0.25f};
        auto r = wav::parse(riff({{"fmt ", fmt}, {"data", bytes_of(samples)}}));
        REQUIRE(r);
        REQUIRE(std::get<std::vector<float>>(r->samples) == samples);
    }

    SECTION("EmptyDataChunk") {
        auto r = wav::parse(riff({{"fmt ", fmt_body(1, 2, 16000, 16)}, {"data", {}}}));
        REQUIRE(r);
        REQUIRE(wav::sample_count(r->samples) == 0);
    }
}

TEST_CASE("wav::parse rejects broken containers as unreadable", "[wav_reader]") {

    SECTION("TooShort") {
        std::vector<uint8_t> image = {'R', 'I', 'F', 'F'};
        REQUIRE(is_unreadable(wav::parse(image)));
    }

    SECTION("NotRiff") {
        auto image = wav::encode(std::vector<int16_t>{1, 2}, 16000);
        std::memcpy(image.data(), "RIFX", 4);
        REQUIRE(is_unreadable(wav::parse(image)));
    }

    SECTION("DeclaredDataLengthPastEndOfFile") {
        auto image = wav::encode(std::vector<int16_t>{1, 2, 3, 4}, 16000);
        image.resize(image.size() - 4);
        REQUIRE(is_unreadable(wav::parse(image)));
    }

    SECTION("DataBeforeFmt") {
        auto image = riff({{"data", {0, 0}}, {"fmt ", fmt_body(1, 1, 16000, 16)}});
        REQUIRE(is_unreadable(wav::parse(image)));
    }

    SECTION("MissingData") {
        auto image = riff({{"fmt ", fmt_body(1, 1, 16000, 16)}});
        REQUIRE(is_unreadable(wav::parse(image)));
    }

    SECTION("MissingFmt") {
        auto image = riff({{"LIST", {0, 0}}});
        REQUIRE(is_unreadable(wav::parse(image)));
    }

    SECTION("ShortFmt") {
        auto fmt = fmt_body(1, 1, 16000, 16);
        fmt.resize(12);
        REQUIRE(is_unreadable(wav::parse(riff({{"fmt ", fmt}, {"data", {0, 0}}}))));
    }

    SECTION("DataNotMultipleOfBlockAlign") {
        auto image = riff({{"fmt ", fmt_body(1, 2, 16000, 16)}, {"data", {0, 0, 0, 0, 0, 0}}});
        REQUIRE(is_unreadable(wav::parse(image)));
    }

    SECTION("ZeroChannels") {
        auto image = riff({{"fmt ", fmt_body(1, 0, 16000, 16)}, {"data", {}}});
        REQUIRE(is_unreadable(wav::parse(image)));
    }
}

TEST_CASE("wav::parse rejects unsupported encodings", "[wav_reader]") {

    SECTION("Pcm24") {
        auto image = riff({{"fmt ", fmt_body(1, 1, 16000, 24)}, {"data", {0, 0, 0}}});
        REQUIRE(is_unsupported(wav::parse(image)));
    }

    SECTION("Pcm8") {
        auto image = riff({{"fmt ", fmt_body(1, 1, 8000, 8)}, {"data", {128, 128}}});
        REQUIRE(is_unsupported(wav::parse(image)));
    }

    SECTION("Pcm32Integer") {
        auto image = riff({{"fmt ", fmt_body(1, 1, 16000, 32)}, {"data", {0, 0, 0, 0}}});
        REQUIRE(is_unsupported(wav::parse(image)));
    }

    SECTION("Float64") {
        auto image = riff({{"fmt ", fmt_body(3, 1, 16000, 64)}, {"data", std::vector<uint8_t>(8)}});
        REQUIRE(is_unsupported(wav::parse(image)));
    }

    SECTION("ThreeChannels") {
        auto image = riff({{"fmt ", fmt_body(1, 3, 16000, 16)}, {"data", std::vector<uint8_t>(6)}});
        REQUIRE(is_unsupported(wav::parse(image)));
    }
}

TEST_CASE("wav::read", "[wav_reader]") {
    TmpDir dir;

    SECTION("MissingFileIsUnreadable") {
        auto r = wav::read((dir.path / "nope.wav").string());
        REQUIRE(is_unreadable(r));
        REQUIRE(r.error().message.find("nope.wav") != std::string::npos);
    }

    SECTION("ReadsFileWithoutModifyingIt") {
        auto path = dir.path / "audio.wav";
        auto image = wav::encode(std::vector<int16_t>{100, -100}, 22050);
        write_file(path, image);

        auto r = wav::read(path.string());
        REQUIRE(r);
        REQUIRE(r->format.sample_rate == 22050);
        REQUIRE(read_file(path) == image);
    }

    SECTION("ErrorMessageNamesFile") {
        auto path = dir.path / "garbage.wav";
        write_file(path, {'n', 'o', 'p', 'e', 0, 0, 0, 0, 0, 0, 0, 0});
        auto r = wav::read(path.string());
        REQUIRE(is_unreadable(r));
        REQUIRE(r.error().message.find("garbage.wav") != std::string::npos);
    }
}
