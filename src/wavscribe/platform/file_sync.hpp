#pragma once

#include <expected>
#include <string>

namespace platform {

// Flushes a file's data to stable storage.
std::expected<void, std::string> sync_file(const std::string& path);

// Flushes the directory holding path, making a rename into it durable.
std::expected<void, std::string> sync_parent_dir(const std::string& path);

} // namespace platform
