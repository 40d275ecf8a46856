#pragma once

#include "platform/remuxer.hpp"

#include <chrono>
#include <string>
#include <vector>

// Runs an external remux command, e.g. ffmpeg with a stream copy.
// "{input}" and "{output}" in the argument template are replaced with the paths.
class ProcessRemuxer : public Remuxer {
public:
    static std::vector<std::string> default_command();

    // A zero timeout waits for the command indefinitely.
    ProcessRemuxer(std::vector<std::string> command, std::chrono::seconds timeout);

    std::expected<void, ToolError> repair(const std::string& src,
                                          const std::string& dst) override;

    std::vector<std::string> build_argv(const std::string& src, const std::string& dst) const;

private:
    std::vector<std::string> command_;
    std::chrono::seconds timeout_;
};
