#pragma once

#include "wav/wav_reader.hpp"

#include <string>

// Fatal outcome of processing one input file.
struct PipelineError {
    enum class Kind {
        Unreadable,
        UnsupportedFormat,
        RepairToolUnavailable,
        RepairToolFailed,          // message is the tool's stderr, verbatim
        RepairToolTimedOut,
        RepairIoFailure,
        StillUnreadableAfterRepair,
        Normalization,
        Engine,
    };

    Kind kind;
    std::string message;
};

PipelineError from_container_error(const wav::ContainerError& err);

const char* kind_name(PipelineError::Kind kind);

// User-facing text, including tool diagnostics where there are any.
std::string describe(const PipelineError& err);
