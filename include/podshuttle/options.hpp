#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace podshuttle {

struct EngineOptions {
    // Local downloads land in <download_root>/<podcast id>/.
    std::filesystem::path download_root{"episodes"};
    // Device copies land in <device root>/<device_namespace>/.
    std::string device_namespace{"PodShuttle"};

    // Ceiling for a whole download, not per chunk.
    std::chrono::seconds http_timeout{300};
    std::chrono::seconds connect_timeout{30};
    std::string user_agent{"podshuttle/1.0"};

    std::size_t copy_buffer_size{64 * 1024};
    std::string sentinel_name{".podshuttle_space_check"};
};

} // namespace podshuttle
