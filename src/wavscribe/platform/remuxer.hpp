#pragma once

#include <expected>
#include <string>

struct ToolError {
    enum class Kind {
        Unavailable,  // could not be launched (missing executable, fork failure)
        Failed,       // ran and exited non-zero; message holds its stderr
        TimedOut,     // killed after exceeding the configured limit
    };

    Kind kind;
    std::string message;
};

// Rewrites a container around its audio stream without re-encoding.
// On success dst holds a complete copy; on failure dst must be treated as garbage.
class Remuxer {
public:
    virtual ~Remuxer() = default;
    virtual std::expected<void, ToolError> repair(const std::string& src,
                                                  const std::string& dst) = 0;
};
