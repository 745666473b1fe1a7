#pragma once

#include "device.hpp"
#include "options.hpp"
#include "progress_table.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace podshuttle {

// Copies episodes to <device_root>/<device_namespace>/<filename>. The filename
// is used as given.
class DeviceTransferEngine {
public:
    DeviceTransferEngine(ProgressTable& progress, EngineOptions options, SpaceProbe probe = queryDeviceSpace);

    void transfer(std::int64_t subject_id,
                  const std::filesystem::path& local_path,
                  const std::filesystem::path& device_root,
                  const std::string& filename);

    [[nodiscard]] std::filesystem::path destinationFor(const std::filesystem::path& device_root,
                                                       const std::string& filename) const;

    [[nodiscard]] static TransferKey keyFor(std::int64_t subject_id, const std::filesystem::path& device_root) {
        return {subject_id, device_root.string()};
    }

private:
    void runTransfer(const TransferKey& key,
                     const std::filesystem::path& local_path,
                     const std::filesystem::path& device_root,
                     const std::string& filename);
    void copyWithProgress(const TransferKey& key,
                          const std::filesystem::path& source,
                          const std::filesystem::path& destination,
                          std::uint64_t total_bytes);

    ProgressTable& progress_;
    EngineOptions options_;
    SpaceProbe probe_;
};

} // namespace podshuttle
