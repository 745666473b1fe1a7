#include "podshuttle/transfer_task.hpp"

#include "podshuttle/device_transfer_engine.hpp"
#include "podshuttle/download_engine.hpp"

#include <utility>

namespace podshuttle {

DownloadTask::DownloadTask(DownloadEngine& engine,
                           std::string source_url,
                           std::int64_t episode_id,
                           std::int64_t podcast_id)
    : engine_(engine),
      source_url_(std::move(source_url)),
      episode_id_(episode_id),
      podcast_id_(podcast_id) {}

void DownloadTask::start() {
    local_path_ = engine_.download(source_url_, episode_id_, podcast_id_);
}

TransferKey DownloadTask::key() const {
    return DownloadEngine::keyFor(episode_id_);
}

std::string DownloadTask::label() const {
    return deriveEpisodeFilename(source_url_, episode_id_);
}

DeviceCopyTask::DeviceCopyTask(DeviceTransferEngine& engine,
                               std::int64_t episode_id,
                               std::filesystem::path local_path,
                               std::filesystem::path device_root,
                               std::string filename)
    : engine_(engine),
      episode_id_(episode_id),
      local_path_(std::move(local_path)),
      device_root_(std::move(device_root)),
      filename_(std::move(filename)) {}

void DeviceCopyTask::start() {
    engine_.transfer(episode_id_, local_path_, device_root_, filename_);
}

TransferKey DeviceCopyTask::key() const {
    return DeviceTransferEngine::keyFor(episode_id_, device_root_);
}

} // namespace podshuttle
