#include "podshuttle/device_transfer_engine.hpp"

#include "podshuttle/errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace podshuttle {

namespace fs = std::filesystem;

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

} // namespace

DeviceTransferEngine::DeviceTransferEngine(ProgressTable& progress, EngineOptions options, SpaceProbe probe)
    : progress_(progress), options_(std::move(options)), probe_(std::move(probe)) {
    if (options_.copy_buffer_size == 0) {
        options_.copy_buffer_size = 64 * 1024;
    }
}

fs::path DeviceTransferEngine::destinationFor(const fs::path& device_root, const std::string& filename) const {
    return device_root / options_.device_namespace / filename;
}

void DeviceTransferEngine::transfer(std::int64_t subject_id,
                                    const fs::path& local_path,
                                    const fs::path& device_root,
                                    const std::string& filename) {
    const TransferKey key = keyFor(subject_id, device_root);
    if (!progress_.begin(key)) {
        throw TransferError(ErrorKind::Generic,
                            fmt::format("Transfer of episode {} to {} already in progress", subject_id,
                                        device_root.string()));
    }
    spdlog::info("Transferring {} to device {}", filename, device_root.string());

    try {
        runTransfer(key, local_path, device_root, filename);
    } catch (const TransferError& ex) {
        progress_.fail(key, ex.what());
        spdlog::error("Failed to transfer {}: {}", filename, ex.what());
        throw;
    } catch (const fs::filesystem_error& ex) {
        progress_.fail(key, ex.what());
        spdlog::error("Failed to transfer {}: {}", filename, ex.what());
        throw TransferError(ErrorKind::IoError, fmt::format("Transfer of {} failed: {}", filename, ex.what()));
    }

    progress_.complete(key);
    spdlog::info("Transferred {} to device {}", filename, device_root.string());
}

void DeviceTransferEngine::runTransfer(const TransferKey& key,
                                       const fs::path& local_path,
                                       const fs::path& device_root,
                                       const std::string& filename) {
    std::error_code ec;
    if (!fs::exists(local_path, ec)) {
        throw TransferError(ErrorKind::NotFound, fmt::format("Source file not found: {}", local_path.string()));
    }
    if (!fs::exists(device_root, ec)) {
        throw TransferError(ErrorKind::DeviceNotFound, fmt::format("Device not found: {}", device_root.string()));
    }

    const std::uint64_t file_size = fs::file_size(local_path, ec);
    if (ec) {
        throw TransferError(ErrorKind::IoError,
                            fmt::format("Cannot read source file {}: {}", local_path.string(), ec.message()));
    }

    // Must run before anything is created on the device.
    std::optional<DeviceSpace> space;
    if (probe_) {
        space = probe_(device_root);
    }
    if (!space) {
        spdlog::warn("Could not determine free space on {}, skipping space check", device_root.string());
    } else if (space->available_bytes < file_size) {
        throw TransferError(ErrorKind::InsufficientSpace,
                            fmt::format("Insufficient space on device {}. Need {} bytes, available {} bytes",
                                        device_root.string(), file_size, space->available_bytes));
    }

    const fs::path target_dir = device_root / options_.device_namespace;
    fs::create_directories(target_dir, ec);
    if (ec) {
        throw TransferError(ErrorKind::IoError,
                            fmt::format("Cannot create directory {} on device: {}", target_dir.string(),
                                        ec.message()));
    }

    progress_.advance(key, 0, file_size, ProgressTable::Clock::duration::zero());
    copyWithProgress(key, local_path, target_dir / filename, file_size);
}

void DeviceTransferEngine::copyWithProgress(const TransferKey& key,
                                            const fs::path& source,
                                            const fs::path& destination,
                                            std::uint64_t total_bytes) {
    FilePtr in{std::fopen(source.c_str(), "rb")};
    if (!in) {
        const int err = errno;
        throw TransferError(ErrorKind::IoError,
                            fmt::format("Cannot open source file {}: {}", source.string(), std::strerror(err)));
    }

    FilePtr out{std::fopen(destination.c_str(), "wb")};
    if (!out) {
        const int err = errno;
        throw TransferError(ErrorKind::IoError,
                            fmt::format("Cannot create destination file {}: {}", destination.string(),
                                        std::strerror(err)));
    }

    std::vector<char> buffer(options_.copy_buffer_size);
    std::uint64_t transferred = 0;
    const auto started = ProgressTable::Clock::now();

    while (true) {
        const size_t bytes_read = std::fread(buffer.data(), 1, buffer.size(), in.get());
        if (bytes_read == 0) {
            if (std::ferror(in.get())) {
                const int err = errno;
                throw TransferError(ErrorKind::IoError,
                                    fmt::format("Read error on {}: {}", source.string(), std::strerror(err)));
            }
            break;
        }

        if (std::fwrite(buffer.data(), 1, bytes_read, out.get()) != bytes_read) {
            const int err = errno;
            throw TransferError(ErrorKind::IoError,
                                fmt::format("Write error on {}: {}", destination.string(), std::strerror(err)));
        }

        transferred += bytes_read;
        progress_.advance(key, transferred, total_bytes, ProgressTable::Clock::now() - started);
    }

    if (std::fflush(out.get()) != 0) {
        const int err = errno;
        throw TransferError(ErrorKind::IoError,
                            fmt::format("Flush error on {}: {}", destination.string(), std::strerror(err)));
    }
    if (std::fclose(out.release()) != 0) {
        const int err = errno;
        throw TransferError(ErrorKind::IoError,
                            fmt::format("Cannot close {}: {}", destination.string(), std::strerror(err)));
    }
}

} // namespace podshuttle
