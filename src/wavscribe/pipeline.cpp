#include "pipeline.hpp"

#include "audio/normalizer.hpp"

#include <chrono>
#include <print>

Pipeline::Pipeline(PipelineOptions options, Remuxer& remuxer, bool verbose)
    : options_(std::move(options)), coordinator_(remuxer, verbose), verbose_(verbose) {}

std::expected<wav::WavContents, PipelineError> Pipeline::open() {
    if (options_.attempt_repair) {
        return coordinator_.open_with_repair(options_.input_path);
    }

    auto contents = wav::read(options_.input_path);
    if (!contents) {
        return std::unexpected(from_container_error(contents.error()));
    }
    return std::move(*contents);
}

std::expected<LoadedAudio, PipelineError> Pipeline::load_audio() {
    auto contents = open();
    if (!contents) return std::unexpected(contents.error());

    const auto format = contents->format;
    std::println(stderr, "audio: sample rate {}, channels {}, bits per sample {}",
                 format.sample_rate, format.channels, format.bits_per_sample);

    LoadedAudio loaded{.format = format, .samples = {}, .warnings = {}};
    if (auto warning = sample_rate_warning(format, options_.expected_sample_rate)) {
        std::println(stderr, "audio: warning: {}", *warning);
        loaded.warnings.push_back(std::move(*warning));
    }

    auto samples = normalize(format, contents->samples);
    if (!samples) {
        return std::unexpected(PipelineError{PipelineError::Kind::Normalization,
                                             samples.error().message});
    }
    loaded.samples = std::move(*samples);

    std::println(stderr, "audio: loaded {} samples", loaded.samples.size());
    if (verbose_) {
        std::println(stderr, "audio: {:.2f}s of audio",
                     static_cast<double>(loaded.samples.size()) / format.sample_rate);
    }
    return loaded;
}

std::expected<PipelineResult, PipelineError> Pipeline::transcribe(LoadedAudio audio,
                                                                  WhisperBackend& backend) {
    auto start = std::chrono::steady_clock::now();
    auto segments = backend.transcribe(audio.samples, audio.format.sample_rate, options_.decode);
    auto end = std::chrono::steady_clock::now();
    double inference_s = std::chrono::duration<double>(end - start).count();

    if (!segments) {
        return std::unexpected(PipelineError{PipelineError::Kind::Engine, segments.error()});
    }

    std::println(stderr, "engine: transcription completed in {:.2f}s", inference_s);

    return PipelineResult{
        .format = audio.format,
        .sample_count = audio.samples.size(),
        .segments = std::move(*segments),
        .inference_s = inference_s,
    };
}

std::expected<PipelineResult, PipelineError> Pipeline::run(WhisperBackend& backend) {
    auto loaded = load_audio();
    if (!loaded) return std::unexpected(loaded.error());
    return transcribe(std::move(*loaded), backend);
}
