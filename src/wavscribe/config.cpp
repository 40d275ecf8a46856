#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <charconv>
#include <filesystem>
#include <limits>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void load_decode(const json& e, DecodeConfig& d) {
    if (e.contains("language")) d.language = e["language"].get<std::string>();
    if (e.contains("strategy")) {
        auto s = e["strategy"].get<std::string>();
        if (s == "greedy") {
            d.strategy = DecodeConfig::Strategy::Greedy;
        } else if (s == "beam_search") {
            d.strategy = DecodeConfig::Strategy::BeamSearch;
        } else {
            std::println(stderr, "config: unknown strategy '{}', keeping default", s);
        }
    }
    if (e.contains("beam_size")) d.beam_size = e["beam_size"].get<int>();
    if (e.contains("patience")) d.patience = e["patience"].get<float>();
    if (e.contains("threads")) d.threads = e["threads"].get<int>();
    if (e.contains("translate")) d.translate = e["translate"].get<bool>();
    if (e.contains("print_progress")) d.print_progress = e["print_progress"].get<bool>();
    if (e.contains("print_timestamps")) d.print_timestamps = e["print_timestamps"].get<bool>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    // Parse into a scratch copy so a bad value leaves the defaults intact
    Config parsed;
    try {
        auto j = json::parse(f);

        if (j.contains("input")) parsed.input = j["input"].get<std::string>();

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("expected_sample_rate")) {
                parsed.audio.expected_sample_rate = a["expected_sample_rate"].get<uint32_t>();
            }
        }

        if (j.contains("repair")) {
            auto& r = j["repair"];
            if (r.contains("enabled")) parsed.repair.enabled = r["enabled"].get<bool>();
            if (r.contains("timeout_seconds")) {
                auto& t = r["timeout_seconds"];
                if (t.is_number_unsigned() &&
                    t.get<uint64_t>() <= std::numeric_limits<uint32_t>::max()) {
                    parsed.repair.timeout_seconds = t.get<uint32_t>();
                } else {
                    std::println(stderr, "config: repair.timeout_seconds {} is not a valid "
                                         "number of seconds, keeping default", t.dump());
                }
            }
            if (r.contains("command")) {
                parsed.repair.command = r["command"].get<std::vector<std::string>>();
            }
        }

        if (j.contains("engine")) {
            auto& e = j["engine"];
            if (e.contains("type")) parsed.engine.type = e["type"].get<std::string>();
            if (e.contains("model")) parsed.engine.model = e["model"].get<std::string>();
            if (e.contains("url")) parsed.engine.url = e["url"].get<std::string>();
            if (e.contains("api_format")) parsed.engine.api_format = e["api_format"].get<std::string>();
            load_decode(e, parsed.engine.decode);
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("format")) parsed.output.format = o["format"].get<std::string>();
        }

        cfg = std::move(parsed);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

std::optional<uint32_t> parse_seconds(std::string_view text) {
    uint32_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}
