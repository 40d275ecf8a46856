#pragma once

#include "errors.hpp"
#include "platform/remuxer.hpp"
#include "repair/repair_coordinator.hpp"
#include "wav/wav_reader.hpp"
#include "whisper/backend.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

struct PipelineOptions {
    std::string input_path;
    bool attempt_repair = true;
    uint32_t expected_sample_rate = 16000;
    DecodeConfig decode;
};

struct LoadedAudio {
    wav::AudioFormat format;
    std::vector<float> samples; // mono float32, one per frame
    std::vector<std::string> warnings;
};

struct PipelineResult {
    wav::AudioFormat format;
    size_t sample_count = 0;
    std::vector<TranscriptSegment> segments;
    double inference_s = 0.0;
};

// Processes one file: open (repairing if allowed), normalize, transcribe.
// Stops at the first fatal error; nothing is transcribed from a partial load.
class Pipeline {
public:
    Pipeline(PipelineOptions options, Remuxer& remuxer, bool verbose = false);

    std::expected<LoadedAudio, PipelineError> load_audio();
    std::expected<PipelineResult, PipelineError> transcribe(LoadedAudio audio,
                                                            WhisperBackend& backend);

    // load_audio() followed by transcribe()
    std::expected<PipelineResult, PipelineError> run(WhisperBackend& backend);

    const RepairCoordinator& repair() const { return coordinator_; }

private:
    std::expected<wav::WavContents, PipelineError> open();

    PipelineOptions options_;
    RepairCoordinator coordinator_;
    bool verbose_;
};
