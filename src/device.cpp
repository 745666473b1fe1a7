#include "podshuttle/device.hpp"

#include "podshuttle/errors.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <sys/statvfs.h>

namespace podshuttle {

namespace fs = std::filesystem;

std::optional<DeviceSpace> queryDeviceSpace(const fs::path& device_root) {
    struct statvfs stats {};
    if (::statvfs(device_root.c_str(), &stats) != 0) {
        return std::nullopt;
    }

    DeviceSpace space;
    space.total_bytes = static_cast<std::uint64_t>(stats.f_blocks) * stats.f_frsize;
    space.available_bytes = static_cast<std::uint64_t>(stats.f_bavail) * stats.f_frsize;
    return space;
}

std::vector<DeviceFileEntry> listDeviceFiles(const fs::path& directory) {
    std::vector<DeviceFileEntry> entries;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return entries;
    }

    fs::directory_iterator it{directory, ec};
    if (ec) {
        throw TransferError(ErrorKind::IoError,
                            fmt::format("Cannot read device directory {}: {}", directory.string(), ec.message()));
    }

    for (; it != fs::directory_iterator{}; it.increment(ec)) {
        if (ec) {
            throw TransferError(ErrorKind::IoError,
                                fmt::format("Cannot read device directory {}: {}", directory.string(),
                                            ec.message()));
        }
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }

        DeviceFileEntry file;
        file.filename = entry.path().filename().string();
        file.size_bytes = entry.file_size(entry_ec);
        if (entry_ec) {
            spdlog::warn("Cannot stat {}: {}", entry.path().string(), entry_ec.message());
            continue;
        }
        file.last_modified = entry.last_write_time(entry_ec);
        entries.push_back(std::move(file));
    }
    if (ec) {
        throw TransferError(ErrorKind::IoError,
                            fmt::format("Cannot read device directory {}: {}", directory.string(), ec.message()));
    }

    std::sort(entries.begin(), entries.end(),
              [](const DeviceFileEntry& a, const DeviceFileEntry& b) { return a.filename < b.filename; });
    return entries;
}

std::string sanitizeEpisodeFilename(const std::string& title) {
    std::string name;
    name.reserve(title.size() + 4);
    for (const char c : title) {
        const auto uc = static_cast<unsigned char>(c);
        name.push_back((std::isalnum(uc) || c == ' ' || c == '-' || c == '_') ? c : '_');
    }

    const auto first = name.find_first_not_of(' ');
    if (first == std::string::npos) {
        name.clear();
    } else {
        name = name.substr(first, name.find_last_not_of(' ') - first + 1);
    }
    return name + ".mp3";
}

} // namespace podshuttle
