#pragma once

#include "progress_table.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace podshuttle {

class DownloadEngine;
class DeviceTransferEngine;

class TransferTask {
public:
    virtual ~TransferTask() = default;

    // Runs the operation to completion; failures surface as TransferError.
    virtual void start() = 0;
    [[nodiscard]] virtual TransferKey key() const = 0;
    [[nodiscard]] virtual std::string label() const = 0;
};

using TransferTaskPtr = std::shared_ptr<TransferTask>;

class DownloadTask final : public TransferTask {
public:
    DownloadTask(DownloadEngine& engine, std::string source_url, std::int64_t episode_id, std::int64_t podcast_id);

    void start() override;
    [[nodiscard]] TransferKey key() const override;
    [[nodiscard]] std::string label() const override;

    // Empty until start() has succeeded.
    [[nodiscard]] const std::filesystem::path& localPath() const { return local_path_; }

private:
    DownloadEngine& engine_;
    std::string source_url_;
    std::int64_t episode_id_;
    std::int64_t podcast_id_;
    std::filesystem::path local_path_;
};

class DeviceCopyTask final : public TransferTask {
public:
    DeviceCopyTask(DeviceTransferEngine& engine,
                   std::int64_t episode_id,
                   std::filesystem::path local_path,
                   std::filesystem::path device_root,
                   std::string filename);

    void start() override;
    [[nodiscard]] TransferKey key() const override;
    [[nodiscard]] std::string label() const override { return filename_; }

private:
    DeviceTransferEngine& engine_;
    std::int64_t episode_id_;
    std::filesystem::path local_path_;
    std::filesystem::path device_root_;
    std::string filename_;
};

} // namespace podshuttle
