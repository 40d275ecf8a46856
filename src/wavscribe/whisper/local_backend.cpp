#include "local_backend.hpp"

#include <filesystem>
#include <whisper.h>

LocalBackend::LocalBackend() = default;

LocalBackend::~LocalBackend() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

std::expected<void, std::string> LocalBackend::load(const std::string& model_path) {
    if (!std::filesystem::exists(model_path)) {
        return std::unexpected("model not found: " + model_path);
    }

    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }

    whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        return std::unexpected("failed to load model: " + model_path);
    }
    return {};
}

std::expected<std::vector<TranscriptSegment>, std::string>
LocalBackend::transcribe(std::span<const float> audio, uint32_t /*sample_rate*/,
                         const DecodeConfig& config) {
    if (!ctx_) {
        return std::unexpected("no model loaded");
    }
    if (audio.empty()) {
        return std::unexpected("empty audio");
    }

    auto strategy = config.strategy == DecodeConfig::Strategy::Greedy
        ? WHISPER_SAMPLING_GREEDY
        : WHISPER_SAMPLING_BEAM_SEARCH;
    whisper_full_params wparams = whisper_full_default_params(strategy);
    wparams.beam_search.beam_size = config.beam_size;
    wparams.beam_search.patience = config.patience;
    wparams.language = config.language.empty() ? "auto" : config.language.c_str();
    wparams.translate = config.translate;
    wparams.print_progress = config.print_progress;
    wparams.print_timestamps = config.print_timestamps;
    wparams.print_realtime = false;
    wparams.print_special = false;
    if (config.threads > 0) {
        wparams.n_threads = config.threads;
    }

    int rc = whisper_full(ctx_, wparams, audio.data(), static_cast<int>(audio.size()));
    if (rc != 0) {
        return std::unexpected("whisper_full failed with code " + std::to_string(rc));
    }

    // Segment timestamps are in units of 10 ms
    std::vector<TranscriptSegment> segments;
    int n = whisper_full_n_segments(ctx_);
    segments.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        segments.push_back(TranscriptSegment{
            .start = std::chrono::milliseconds(whisper_full_get_segment_t0(ctx_, i) * 10),
            .end = std::chrono::milliseconds(whisper_full_get_segment_t1(ctx_, i) * 10),
            .text = whisper_full_get_segment_text(ctx_, i),
        });
    }
    return segments;
}
