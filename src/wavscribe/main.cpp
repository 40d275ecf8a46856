#include "config.hpp"
#include "pipeline.hpp"
#include "platform/linux/process_remuxer.hpp"
#include "report/transcript_formatter.hpp"
#include "whisper/backend_factory.hpp"

#include <chrono>
#include <cstdlib>
#include <print>
#include <string>

static void usage(const char* prog) {
    std::println("Usage: {} [options] [input.wav]", prog);
    std::println("Options:");
    std::println("  -i, --input PATH        WAV file to transcribe (default: audio.wav)");
    std::println("  -m, --model PATH        Model file for the local backend");
    std::println("  -c, --config PATH       Config file path");
    std::println("  -l, --language LANG     Language hint (default: en)");
    std::println("  -b, --beam-size N       Beam search width");
    std::println("      --greedy            Use greedy decoding instead of beam search");
    std::println("      --backend TYPE      local or lan");
    std::println("      --url URL           Server URL for the lan backend");
    std::println("      --format FMT        text, json or srt");
    std::println("      --no-repair         Fail instead of remuxing an unreadable file");
    std::println("      --repair-timeout N  Seconds to wait for the remux tool (0 = no limit)");
    std::println("  -v, --verbose           Enable verbose logging");
    std::println("  -h, --help              Show this help");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;

    // First pass: find the config file so command-line flags can override it
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && has_value) {
            ++i;
        } else if ((arg == "--input" || arg == "-i") && has_value) {
            config.input = argv[++i];
        } else if ((arg == "--model" || arg == "-m") && has_value) {
            config.engine.model = argv[++i];
        } else if ((arg == "--language" || arg == "-l") && has_value) {
            config.engine.decode.language = argv[++i];
        } else if ((arg == "--beam-size" || arg == "-b") && has_value) {
            config.engine.decode.beam_size = std::atoi(argv[++i]);
            config.engine.decode.strategy = DecodeConfig::Strategy::BeamSearch;
        } else if (arg == "--greedy") {
            config.engine.decode.strategy = DecodeConfig::Strategy::Greedy;
        } else if (arg == "--backend" && has_value) {
            config.engine.type = argv[++i];
        } else if (arg == "--url" && has_value) {
            config.engine.url = argv[++i];
        } else if (arg == "--format" && has_value) {
            config.output.format = argv[++i];
        } else if (arg == "--no-repair") {
            config.repair.enabled = false;
        } else if (arg == "--repair-timeout" && has_value) {
            auto seconds = parse_seconds(argv[++i]);
            if (!seconds) {
                std::println(stderr, "Invalid --repair-timeout: {}", argv[i]);
                return 1;
            }
            config.repair.timeout_seconds = *seconds;
        } else if (!arg.empty() && arg[0] != '-') {
            config.input = arg;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    auto format = report::parse_output_format(config.output.format);
    if (!format) {
        std::println(stderr, "Unknown output format: {}", config.output.format);
        return 1;
    }

    if (verbose) {
        std::println(stderr, "[wavscribe] input {} (backend: {}, repair: {})", config.input,
                     config.engine.type, config.repair.enabled ? "on" : "off");
    }

    auto command = config.repair.command.empty() ? ProcessRemuxer::default_command()
                                                 : config.repair.command;
    ProcessRemuxer remuxer(std::move(command),
                           std::chrono::seconds(config.repair.timeout_seconds));

    Pipeline pipeline(PipelineOptions{
                          .input_path = config.input,
                          .attempt_repair = config.repair.enabled,
                          .expected_sample_rate = config.audio.expected_sample_rate,
                          .decode = config.engine.decode,
                      },
                      remuxer, verbose);

    // Load audio before the model so container problems surface without the model cost
    auto loaded = pipeline.load_audio();
    if (!loaded) {
        std::println(stderr, "Error: {}", describe(loaded.error()));
        return 1;
    }

    auto backend = make_backend(config.engine);
    if (!backend) {
        std::println(stderr, "Error: {}", backend.error());
        return 1;
    }

    auto result = pipeline.transcribe(std::move(*loaded), **backend);
    if (!result) {
        std::println(stderr, "Error: {}", describe(result.error()));
        return 1;
    }

    std::print("{}", report::render(result->segments, *format));
    return 0;
}
