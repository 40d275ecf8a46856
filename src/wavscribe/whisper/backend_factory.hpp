#pragma once

#include "backend.hpp"
#include "config.hpp"

#include <expected>
#include <memory>
#include <string>

// Builds the backend named by engine.type; the local backend loads its model here.
std::expected<std::unique_ptr<WhisperBackend>, std::string>
make_backend(const Config::Engine& engine);
