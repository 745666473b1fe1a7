#pragma once

#include "device.hpp"
#include "episode_store.hpp"
#include "options.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace podshuttle {

struct ConsistencyReport {
    std::size_t files_found{0};
    std::size_t database_episodes{0};
    std::vector<std::string> missing_from_device;
    std::vector<std::string> missing_from_database;
    bool is_consistent{true};
};

struct SyncReport {
    std::size_t processed_files{0};
    std::size_t updated_episodes{0};
    std::uint64_t sync_duration_ms{0};
    // Reflects the device as found, before the sync's own corrections.
    bool is_consistent{true};
};

struct DeviceInventory {
    std::map<std::int64_t, std::vector<DeviceFileEntry>> by_podcast;
    std::vector<DeviceFileEntry> unmatched;
};

// Episodes are matched to device files by the file name of their local path.
class ReconciliationEngine {
public:
    ReconciliationEngine(EpisodeStore& store, EngineOptions options);

    [[nodiscard]] std::vector<DeviceFileEntry> scan(const std::filesystem::path& device_root) const;
    [[nodiscard]] std::vector<std::string> expectedFilenames() const;

    [[nodiscard]] ConsistencyReport verify(const std::filesystem::path& device_root,
                                           const std::vector<std::string>& expected_filenames) const;

    // Clears on_device for episodes whose file is gone. Never sets it.
    SyncReport sync(const std::filesystem::path& device_root);

    [[nodiscard]] std::map<std::string, bool> statusIndicators(const std::filesystem::path& device_root) const;
    [[nodiscard]] DeviceInventory inventory(const std::filesystem::path& device_root) const;

private:
    EpisodeStore& store_;
    EngineOptions options_;
};

} // namespace podshuttle
