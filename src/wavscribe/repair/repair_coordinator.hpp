#pragma once

#include "errors.hpp"
#include "platform/remuxer.hpp"
#include "wav/wav_reader.hpp"

#include <expected>
#include <optional>
#include <string>

// Record of one remux attempt, kept for inspection after open_with_repair().
struct RepairAttempt {
    enum class Outcome { Success, ToolFailure, IoFailure };

    std::string original_path;
    std::string temporary_path;
    Outcome outcome = Outcome::Success;
    std::string message;
};

// Opens a WAV file, remuxing it in place once if the container is unreadable.
class RepairCoordinator {
public:
    RepairCoordinator(Remuxer& remuxer, bool verbose = false);

    std::expected<wav::WavContents, PipelineError> open_with_repair(const std::string& path);

    const std::optional<RepairAttempt>& last_attempt() const { return last_attempt_; }

    // Sibling of path with the extension replaced: audio.wav -> audio.repaired.tmp.wav
    static std::string temporary_path_for(const std::string& path);

private:
    std::expected<void, PipelineError> repair_in_place(const std::string& path);

    Remuxer& remuxer_;
    bool verbose_;
    std::optional<RepairAttempt> last_attempt_;
};
