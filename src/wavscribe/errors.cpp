#include "errors.hpp"

PipelineError from_container_error(const wav::ContainerError& err) {
    auto kind = err.kind == wav::ContainerError::Kind::UnsupportedFormat
        ? PipelineError::Kind::UnsupportedFormat
        : PipelineError::Kind::Unreadable;
    return PipelineError{kind, err.message};
}

const char* kind_name(PipelineError::Kind kind) {
    switch (kind) {
        case PipelineError::Kind::Unreadable: return "unreadable";
        case PipelineError::Kind::UnsupportedFormat: return "unsupported format";
        case PipelineError::Kind::RepairToolUnavailable: return "repair tool unavailable";
        case PipelineError::Kind::RepairToolFailed: return "repair tool failed";
        case PipelineError::Kind::RepairToolTimedOut: return "repair tool timed out";
        case PipelineError::Kind::RepairIoFailure: return "repair I/O failure";
        case PipelineError::Kind::StillUnreadableAfterRepair: return "still unreadable after repair";
        case PipelineError::Kind::Normalization: return "normalization failed";
        case PipelineError::Kind::Engine: return "engine error";
    }
    return "unknown error";
}

std::string describe(const PipelineError& err) {
    switch (err.kind) {
        case PipelineError::Kind::RepairToolUnavailable:
            return "could not launch the remux tool. Is ffmpeg installed and in your PATH?\n" +
                   err.message;
        case PipelineError::Kind::RepairToolFailed:
            return "the remux tool failed to repair the file.\ntool stderr: " + err.message;
        case PipelineError::Kind::StillUnreadableAfterRepair:
            return "file is still unreadable after repair: " + err.message;
        default:
            return std::string(kind_name(err.kind)) + ": " + err.message;
    }
}
