#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace podshuttle {

struct DeviceSpace {
    std::uint64_t total_bytes{0};
    std::uint64_t available_bytes{0};
};

// Reports the space of the filesystem holding a device root, or nullopt when
// it cannot be determined.
using SpaceProbe = std::function<std::optional<DeviceSpace>(const std::filesystem::path&)>;

// statvfs(3) based probe; available space is what an unprivileged user may use.
[[nodiscard]] std::optional<DeviceSpace> queryDeviceSpace(const std::filesystem::path& device_root);

struct DeviceFileEntry {
    std::string filename;
    std::uint64_t size_bytes{0};
    std::filesystem::file_time_type last_modified{};
};

// Regular files directly inside `directory`, sorted by file name. A missing
// directory yields an empty listing.
[[nodiscard]] std::vector<DeviceFileEntry> listDeviceFiles(const std::filesystem::path& directory);

// Turns an episode title into "<title>.mp3", replacing everything except
// alphanumerics, space, '-' and '_' with '_'.
[[nodiscard]] std::string sanitizeEpisodeFilename(const std::string& title);

} // namespace podshuttle
