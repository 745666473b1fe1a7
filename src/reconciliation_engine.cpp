#include "podshuttle/reconciliation_engine.hpp"

#include "podshuttle/errors.hpp"

#include <chrono>
#include <set>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace podshuttle {

namespace fs = std::filesystem;

namespace {

std::string filenameOf(const std::string& local_path) {
    return fs::path{local_path}.filename().string();
}

} // namespace

ReconciliationEngine::ReconciliationEngine(EpisodeStore& store, EngineOptions options)
    : store_(store), options_(std::move(options)) {}

std::vector<DeviceFileEntry> ReconciliationEngine::scan(const fs::path& device_root) const {
    std::error_code ec;
    if (!fs::exists(device_root, ec)) {
        throw TransferError(ErrorKind::DeviceNotFound, fmt::format("Device not found: {}", device_root.string()));
    }
    return listDeviceFiles(device_root / options_.device_namespace);
}

std::vector<std::string> ReconciliationEngine::expectedFilenames() const {
    std::vector<std::string> names;
    for (const auto& episode : store_.onDeviceEpisodes()) {
        if (episode.on_device && episode.local_file_path) {
            names.push_back(filenameOf(*episode.local_file_path));
        }
    }
    return names;
}

ConsistencyReport ReconciliationEngine::verify(const fs::path& device_root,
                                               const std::vector<std::string>& expected_filenames) const {
    spdlog::info("Verifying episode status consistency for {}", device_root.string());

    const auto files = scan(device_root);
    std::set<std::string> on_device;
    for (const auto& file : files) {
        on_device.insert(file.filename);
    }
    const std::set<std::string> expected(expected_filenames.begin(), expected_filenames.end());

    ConsistencyReport report;
    report.files_found = files.size();
    report.database_episodes = expected.size();
    for (const auto& name : expected) {
        if (on_device.count(name) == 0) {
            report.missing_from_device.push_back(name);
        }
    }
    for (const auto& name : on_device) {
        if (expected.count(name) == 0) {
            report.missing_from_database.push_back(name);
        }
    }
    report.is_consistent = report.missing_from_device.empty() && report.missing_from_database.empty();

    if (!report.is_consistent) {
        spdlog::warn("Device {} is inconsistent: {} missing from device, {} unknown to database",
                     device_root.string(), report.missing_from_device.size(),
                     report.missing_from_database.size());
    }
    return report;
}

SyncReport ReconciliationEngine::sync(const fs::path& device_root) {
    spdlog::info("Syncing episode device status for {}", device_root.string());
    const auto started = std::chrono::steady_clock::now();

    const auto files = scan(device_root);
    std::set<std::string> on_device;
    for (const auto& file : files) {
        on_device.insert(file.filename);
    }

    SyncReport report;
    report.processed_files = files.size();

    for (const auto& episode : store_.onDeviceEpisodes()) {
        if (!episode.on_device || !episode.local_file_path) {
            continue;
        }
        const std::string name = filenameOf(*episode.local_file_path);
        if (on_device.count(name) != 0) {
            continue;
        }

        report.is_consistent = false;
        store_.setOnDevice(episode.id, false);
        ++report.updated_episodes;
        spdlog::info("Episode {} ({}) no longer on device {}", episode.id, name, device_root.string());
    }

    report.sync_duration_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)
            .count());
    spdlog::info("Sync of {} finished: {} files, {} episodes updated", device_root.string(),
                 report.processed_files, report.updated_episodes);
    return report;
}

std::map<std::string, bool> ReconciliationEngine::statusIndicators(const fs::path& device_root) const {
    std::map<std::string, bool> indicators;
    for (const auto& file : scan(device_root)) {
        indicators[file.filename] = true;
    }
    return indicators;
}

DeviceInventory ReconciliationEngine::inventory(const fs::path& device_root) const {
    const auto files = scan(device_root);

    std::map<std::string, std::int64_t> owners;
    for (const auto& episode : store_.onDeviceEpisodes()) {
        if (episode.on_device && episode.local_file_path) {
            owners.emplace(filenameOf(*episode.local_file_path), episode.podcast_id);
        }
    }

    DeviceInventory inventory;
    for (const auto& file : files) {
        auto it = owners.find(file.filename);
        if (it == owners.end()) {
            inventory.unmatched.push_back(file);
        } else {
            inventory.by_podcast[it->second].push_back(file);
        }
    }
    return inventory;
}

} // namespace podshuttle
