#include "backend_factory.hpp"

#include "lan_backend.hpp"
#include "local_backend.hpp"

std::expected<std::unique_ptr<WhisperBackend>, std::string>
make_backend(const Config::Engine& engine) {
    if (engine.type == "lan") {
        return std::make_unique<LanBackend>(engine.url, engine.api_format);
    }

    if (engine.type == "local") {
        auto backend = std::make_unique<LocalBackend>();
        if (auto loaded = backend->load(engine.model); !loaded) {
            return std::unexpected(loaded.error());
        }
        return backend;
    }

    return std::unexpected("unknown backend type: " + engine.type);
}
