#include "objxfer/storage_backend.hpp"
#include "objxfer/local_backend.hpp"

namespace objxfer {

std::unique_ptr<StorageBackend> StorageBackendFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& params) {
    auto get = [&](const std::string& name) -> std::string {
        auto it = params.find(name);
        return it != params.end() ? it->second : std::string{};
    };

    if (type == "local") {
        auto path = get("path");
        if (path.empty()) {
            throw StorageError("InvalidArgument", "local backend requires 'path'");
        }
        LocalStorageBackend::Config config;
        config.root = path;
        config.signing_key = get("signing_key");
        auto chunk = get("chunk_size");
        if (!chunk.empty()) {
            try {
                config.chunk_size = std::stoull(chunk);
            } catch (const std::exception&) {
                throw StorageError("InvalidArgument", "invalid chunk_size: " + chunk);
            }
        }
        return std::make_unique<LocalStorageBackend>(config);
    }

    throw StorageError("InvalidArgument", "unknown backend type: " + type);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_local(
    const std::string& root_path,
    const std::string& signing_key) {
    return create("local", {{"path", root_path}, {"signing_key", signing_key}});
}

}  // namespace objxfer
