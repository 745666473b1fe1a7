#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace podshuttle {

struct EpisodeRecord {
    std::int64_t id{0};
    std::int64_t podcast_id{0};
    std::string episode_url;
    bool downloaded{false};
    std::optional<std::string> local_file_path;
    bool on_device{false};
};

// Boundary to the episode database. Only reconciliation writes through it, and
// only to clear the on-device flag.
class EpisodeStore {
public:
    virtual ~EpisodeStore() = default;

    [[nodiscard]] virtual std::vector<EpisodeRecord> onDeviceEpisodes() const = 0;
    virtual void setOnDevice(std::int64_t episode_id, bool on_device) = 0;
};

} // namespace podshuttle
