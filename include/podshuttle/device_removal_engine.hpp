#pragma once

#include "options.hpp"

#include <filesystem>
#include <string>

namespace podshuttle {

// Deletes one episode file from <device_root>/<device_namespace>/. The
// namespace directory itself is never removed.
class DeviceRemovalEngine {
public:
    explicit DeviceRemovalEngine(EngineOptions options);

    void remove(const std::filesystem::path& device_root, const std::string& filename);

private:
    EngineOptions options_;
};

} // namespace podshuttle
