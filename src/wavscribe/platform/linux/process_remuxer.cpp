#include "platform/linux/process_remuxer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr int kExecFailedCode = 127;
constexpr std::chrono::milliseconds kReapInterval{100};

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::unexpected<ToolError> tool_error(ToolError::Kind kind, std::string msg) {
    return std::unexpected(ToolError{kind, std::move(msg)});
}

} // namespace

std::vector<std::string> ProcessRemuxer::default_command() {
    return {"ffmpeg", "-nostdin", "-hide_banner", "-loglevel", "error",
            "-i", "{input}", "-c:a", "copy", "-y", "{output}"};
}

ProcessRemuxer::ProcessRemuxer(std::vector<std::string> command, std::chrono::seconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

std::vector<std::string> ProcessRemuxer::build_argv(const std::string& src,
                                                    const std::string& dst) const {
    std::vector<std::string> argv;
    argv.reserve(command_.size());
    for (const auto& arg : command_) {
        argv.push_back(replace_all(replace_all(arg, "{input}", src), "{output}", dst));
    }
    return argv;
}

std::expected<void, ToolError> ProcessRemuxer::repair(const std::string& src,
                                                      const std::string& dst) {
    if (command_.empty()) {
        return tool_error(ToolError::Kind::Unavailable, "no repair command configured");
    }

    auto args = build_argv(src, dst);
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    const std::string& program = args.front();

    int errpipe[2];
    if (::pipe2(errpipe, O_CLOEXEC) < 0) {
        return tool_error(ToolError::Kind::Unavailable,
                          std::string("pipe2() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(errpipe[0]);
        ::close(errpipe[1]);
        return tool_error(ToolError::Kind::Unavailable,
                          std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdin/stdout to /dev/null, stderr into the pipe
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
        }
        ::dup2(errpipe[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        const char* reason = std::strerror(errno);
        if (::write(STDERR_FILENO, reason, std::strlen(reason)) < 0) {
            ::_exit(kExecFailedCode);
        }
        ::_exit(kExecFailedCode);
    }

    ::close(errpipe[1]);

    std::string diagnostics;
    bool timed_out = false;
    bool stderr_open = true;
    int status = 0;
    auto deadline = std::chrono::steady_clock::now() + timeout_;
    pollfd pfd{.fd = errpipe[0], .events = POLLIN, .revents = 0};

    // Watch the child itself, not only the pipe: a background process it
    // leaves behind may keep stderr open long after the child has exited.
    while (true) {
        pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) break;
        if (reaped < 0 && errno != EINTR) {
            ::close(errpipe[0]);
            return tool_error(ToolError::Kind::Failed,
                              std::string("waitpid() failed: ") + std::strerror(errno));
        }

        auto slice = kReapInterval;
        if (timeout_.count() > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                timed_out = true;
                break;
            }
            slice = std::min(slice, left);
        }
        int wait_ms = static_cast<int>(slice.count());

        if (!stderr_open) {
            ::poll(nullptr, 0, wait_ms);
            continue;
        }

        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            // Cannot watch the child any more; stop it rather than block forever
            timed_out = true;
            break;
        }
        if (ret == 0) continue;

        char buf[4096];
        ssize_t n = ::read(errpipe[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            stderr_open = false;
            continue;
        }
        diagnostics.append(buf, static_cast<size_t>(n));
    }

    if (!timed_out && stderr_open && ::fcntl(errpipe[0], F_SETFL, O_NONBLOCK) == 0) {
        // Take what is already buffered without waiting for writers that outlive the child
        char buf[4096];
        ssize_t n;
        while ((n = ::read(errpipe[0], buf, sizeof(buf))) > 0 || (n < 0 && errno == EINTR)) {
            if (n > 0) diagnostics.append(buf, static_cast<size_t>(n));
        }
    }
    ::close(errpipe[0]);

    if (timed_out) {
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno == EINTR) continue;
            return tool_error(ToolError::Kind::Failed,
                              std::string("waitpid() failed: ") + std::strerror(errno));
        }
        return tool_error(ToolError::Kind::TimedOut,
                          std::format("{} did not finish within {}s", program, timeout_.count()));
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) return {};
        if (code == kExecFailedCode) {
            return tool_error(ToolError::Kind::Unavailable,
                              std::format("cannot run {}: {}", program,
                                          diagnostics.empty() ? "exit code 127" : diagnostics));
        }
        if (diagnostics.empty()) {
            diagnostics = std::format("{} exited with code {}", program, code);
        }
        return tool_error(ToolError::Kind::Failed, std::move(diagnostics));
    }

    if (WIFSIGNALED(status)) {
        return tool_error(ToolError::Kind::Failed,
                          std::format("{} killed by signal {}", program, WTERMSIG(status)));
    }

    return tool_error(ToolError::Kind::Failed, program + " ended abnormally");
}
