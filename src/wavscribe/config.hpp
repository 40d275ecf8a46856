#pragma once

#include "whisper/backend.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct Config {
    std::string input = "audio.wav";

    struct Audio {
        uint32_t expected_sample_rate = 16000;
    } audio;

    struct Repair {
        bool enabled = true;
        uint32_t timeout_seconds = 120; // 0 = wait indefinitely
        std::vector<std::string> command; // empty = ffmpeg stream copy
    } repair;

    struct Engine {
        std::string type = "local"; // "local" or "lan"
        std::string model = "models/ggml-base.en.bin";
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        DecodeConfig decode;
    } engine;

    struct Output {
        std::string format = "text"; // "text", "json" or "srt"
    } output;

    static Config load(const std::string& path);
    static Config load_default();
};

// Non-negative whole number of seconds, as given to --repair-timeout.
std::optional<uint32_t> parse_seconds(std::string_view text);
