#include "podshuttle/device_removal_engine.hpp"

#include "podshuttle/errors.hpp"

#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace podshuttle {

namespace fs = std::filesystem;

DeviceRemovalEngine::DeviceRemovalEngine(EngineOptions options) : options_(std::move(options)) {}

void DeviceRemovalEngine::remove(const fs::path& device_root, const std::string& filename) {
    spdlog::info("Removing {} from device {}", filename, device_root.string());

    std::error_code ec;
    if (!fs::exists(device_root, ec)) {
        spdlog::warn("Device path not found: {}", device_root.string());
        throw TransferError(ErrorKind::DeviceNotFound, fmt::format("Device not found: {}", device_root.string()));
    }

    const fs::path file_path = device_root / options_.device_namespace / filename;
    if (!fs::exists(file_path, ec)) {
        spdlog::warn("Episode file not found on device: {}", file_path.string());
        throw TransferError(ErrorKind::NotFound, fmt::format("Episode file '{}' not found on device", filename));
    }

    if (!fs::remove(file_path, ec) || ec) {
        spdlog::error("Failed to remove {}: {}", file_path.string(), ec.message());
        throw TransferError(ErrorKind::IoError,
                            fmt::format("Failed to remove episode file '{}': {}", filename, ec.message()));
    }
    spdlog::info("Removed episode file {}", file_path.string());
}

} // namespace podshuttle
