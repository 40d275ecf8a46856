#include "repair/repair_coordinator.hpp"

#include "platform/file_sync.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

RepairCoordinator::RepairCoordinator(Remuxer& remuxer, bool verbose)
    : remuxer_(remuxer), verbose_(verbose) {}

std::string RepairCoordinator::temporary_path_for(const std::string& path) {
    fs::path p(path);
    p.replace_extension(".repaired.tmp.wav");
    return p.string();
}

std::expected<wav::WavContents, PipelineError>
RepairCoordinator::open_with_repair(const std::string& path) {
    last_attempt_.reset();

    auto first = wav::read(path);
    if (first) return std::move(*first);

    if (first.error().kind == wav::ContainerError::Kind::UnsupportedFormat) {
        // A remux copies the stream verbatim, it cannot change the encoding
        return std::unexpected(from_container_error(first.error()));
    }

    std::println(stderr, "repair: {}, attempting in-place remux", first.error().message);

    if (auto repaired = repair_in_place(path); !repaired) {
        return std::unexpected(repaired.error());
    }

    auto second = wav::read(path);
    if (second) return std::move(*second);

    if (second.error().kind == wav::ContainerError::Kind::UnsupportedFormat) {
        return std::unexpected(from_container_error(second.error()));
    }
    return std::unexpected(PipelineError{
        PipelineError::Kind::StillUnreadableAfterRepair,
        second.error().message,
    });
}

std::expected<void, PipelineError> RepairCoordinator::repair_in_place(const std::string& path) {
    auto tmp = temporary_path_for(path);
    last_attempt_ = RepairAttempt{.original_path = path, .temporary_path = tmp};

    std::error_code ec;
    fs::remove(tmp, ec); // stale leftover from an earlier crash

    auto fail = [&](RepairAttempt::Outcome outcome, PipelineError err) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        last_attempt_->outcome = outcome;
        last_attempt_->message = err.message;
        return std::unexpected(std::move(err));
    };

    auto result = remuxer_.repair(path, tmp);
    if (!result) {
        auto kind = PipelineError::Kind::RepairToolFailed;
        switch (result.error().kind) {
            case ToolError::Kind::Unavailable: kind = PipelineError::Kind::RepairToolUnavailable; break;
            case ToolError::Kind::Failed: kind = PipelineError::Kind::RepairToolFailed; break;
            case ToolError::Kind::TimedOut: kind = PipelineError::Kind::RepairToolTimedOut; break;
        }
        return fail(RepairAttempt::Outcome::ToolFailure, PipelineError{kind, result.error().message});
    }

    // The remuxed data must be on disk before the rename can expose it
    if (auto synced = platform::sync_file(tmp); !synced) {
        return fail(RepairAttempt::Outcome::IoFailure,
                    PipelineError{PipelineError::Kind::RepairIoFailure, synced.error()});
    }

    // rename(2) within one directory: the original is either old or fully repaired
    fs::rename(tmp, path, ec);
    if (ec) {
        return fail(RepairAttempt::Outcome::IoFailure,
                    PipelineError{PipelineError::Kind::RepairIoFailure,
                                  "cannot replace " + path + ": " + ec.message()});
    }

    // Already replaced at this point, so a failed directory sync is only reported
    if (auto synced = platform::sync_parent_dir(path); !synced) {
        std::println(stderr, "repair: warning: {}", synced.error());
    }

    last_attempt_->outcome = RepairAttempt::Outcome::Success;
    if (verbose_) {
        std::println(stderr, "repair: replaced '{}' with remuxed copy", path);
    }
    return {};
}
