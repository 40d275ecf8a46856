#include "platform/file_sync.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace platform {

namespace {

std::expected<void, std::string> sync_fd_of(const std::string& path, int flags) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) {
        return std::unexpected("cannot open " + path + ": " + std::strerror(errno));
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc < 0) {
        return std::unexpected("fsync " + path + ": " + std::strerror(err));
    }
    return {};
}

} // namespace

std::expected<void, std::string> sync_file(const std::string& path) {
    return sync_fd_of(path, O_RDONLY);
}

std::expected<void, std::string> sync_parent_dir(const std::string& path) {
    auto dir = std::filesystem::path(path).parent_path();
    if (dir.empty()) dir = ".";
    return sync_fd_of(dir.string(), O_RDONLY | O_DIRECTORY);
}

} // namespace platform
