#pragma once

#include "options.hpp"
#include "progress_table.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace podshuttle {

// Last segment of the URL path when it looks like a file name, otherwise
// "<subject_id>.mp3". Query strings and fragments are never part of the result.
[[nodiscard]] std::string deriveEpisodeFilename(const std::string& source_url, std::int64_t subject_id);

// Streams episodes into <download_root>/<namespace_id>/<file name>. Partial
// files are left on disk after a failure.
class DownloadEngine {
public:
    DownloadEngine(ProgressTable& progress, EngineOptions options);
    ~DownloadEngine();

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    std::filesystem::path download(const std::string& source_url,
                                   std::int64_t subject_id,
                                   std::int64_t namespace_id);

    [[nodiscard]] std::filesystem::path destinationFor(const std::string& source_url,
                                                       std::int64_t subject_id,
                                                       std::int64_t namespace_id) const;

    // Deletes a downloaded file (if present) and forgets the subject's progress.
    // Returns true when a file was removed.
    bool removeDownloaded(std::int64_t subject_id, const std::filesystem::path& local_path);

    [[nodiscard]] static TransferKey keyFor(std::int64_t subject_id) { return {subject_id, {}}; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace podshuttle
