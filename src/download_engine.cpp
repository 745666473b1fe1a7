#include "podshuttle/download_engine.hpp"

#include "podshuttle/detail/curl_utils.hpp"
#include "podshuttle/errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace podshuttle {

namespace fs = std::filesystem;

std::string deriveEpisodeFilename(const std::string& source_url, std::int64_t subject_id) {
    const std::string fallback = fmt::format("{}.mp3", subject_id);

    detail::CurlUrlHandle url{curl_url(), &curl_url_cleanup};
    if (!url || curl_url_set(url.get(), CURLUPART_URL, source_url.c_str(), 0) != CURLUE_OK) {
        return fallback;
    }

    char* raw_path = nullptr;
    if (curl_url_get(url.get(), CURLUPART_PATH, &raw_path, 0) != CURLUE_OK || !raw_path) {
        return fallback;
    }
    const std::string path{raw_path};
    curl_free(raw_path);

    const auto slash = path.find_last_of('/');
    std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);
    if (segment.find('.') == std::string::npos || segment.size() >= 255 || segment == "." ||
        segment == "..") {
        return fallback;
    }
    return segment;
}

class DownloadEngine::Impl {
public:
    Impl(ProgressTable& progress, EngineOptions options)
        : progress_(progress), options_(std::move(options)) {
        detail::ensureCurlInitialized();
    }

    fs::path download(const std::string& source_url, std::int64_t subject_id, std::int64_t namespace_id) {
        const TransferKey key = keyFor(subject_id);
        const fs::path destination = destinationFor(source_url, subject_id, namespace_id);

        // A partially written destination belongs to the active download.
        if (progress_.isActive(key)) {
            throw alreadyInProgress(subject_id);
        }

        std::error_code ec;
        if (fs::exists(destination, ec)) {
            const auto size = fs::file_size(destination, ec);
            if (!progress_.markAlreadyComplete(key, ec ? 0 : size)) {
                throw alreadyInProgress(subject_id);
            }
            spdlog::info("Episode {} already downloaded at {}", subject_id, destination.string());
            return destination;
        }

        if (!progress_.begin(key)) {
            throw alreadyInProgress(subject_id);
        }
        spdlog::info("Starting download for episode {} from {}", subject_id, source_url);

        try {
            prepareDirectory(destination.parent_path());
            fetch(source_url, key, destination);
        } catch (const TransferError& ex) {
            progress_.fail(key, ex.what());
            spdlog::error("Failed to download episode {}: {}", subject_id, ex.what());
            throw;
        }

        progress_.complete(key);
        spdlog::info("Downloaded episode {} to {}", subject_id, destination.string());
        return destination;
    }

    [[nodiscard]] fs::path destinationFor(const std::string& source_url,
                                          std::int64_t subject_id,
                                          std::int64_t namespace_id) const {
        return options_.download_root / std::to_string(namespace_id) /
               deriveEpisodeFilename(source_url, subject_id);
    }

    bool removeDownloaded(std::int64_t subject_id, const fs::path& local_path) {
        std::error_code ec;
        const bool removed = fs::remove(local_path, ec);
        if (ec) {
            throw TransferError(ErrorKind::IoError,
                                fmt::format("Failed to delete {}: {}", local_path.string(), ec.message()));
        }

        progress_.eraseSubject(subject_id);
        spdlog::info("Deleted local file for episode {}: {}", subject_id, local_path.string());
        return removed;
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    static TransferError alreadyInProgress(std::int64_t subject_id) {
        return TransferError(ErrorKind::Generic,
                             fmt::format("Download already in progress for episode {}", subject_id));
    }

    struct StreamContext {
        Impl* owner{nullptr};
        CURL* handle{nullptr};
        TransferKey key;
        std::string url;
        fs::path destination;
        std::unique_ptr<FILE, FileDeleter> file{};
        std::uint64_t total_bytes{0};
        std::uint64_t written_bytes{0};
        ProgressTable::Clock::time_point started{};
        bool has_failure{false};
        ErrorKind failure_kind{ErrorKind::Generic};
        std::string failure;
    };

    void prepareDirectory(const fs::path& directory) const {
        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            throw TransferError(ErrorKind::IoError,
                                fmt::format("Failed to create download directory {}: {}",
                                            directory.string(), ec.message()));
        }

        const fs::path sentinel = directory / options_.sentinel_name;
        std::unique_ptr<FILE, FileDeleter> probe{std::fopen(sentinel.c_str(), "wb")};
        if (!probe || std::fwrite("test", 1, 4, probe.get()) != 4 || std::fflush(probe.get()) != 0) {
            const int err = errno;
            if (probe) {
                probe.reset();
                fs::remove(sentinel, ec);
            }
            throw TransferError(ErrorKind::IoError,
                                fmt::format("Insufficient disk space or permissions in {}: {}",
                                            directory.string(), std::strerror(err)));
        }
        probe.reset();

        fs::remove(sentinel, ec);
        if (ec) {
            spdlog::warn("Could not remove space check file {}: {}", sentinel.string(), ec.message());
        }
    }

    void fetch(const std::string& source_url, const TransferKey& key, const fs::path& destination) {
        auto curl = detail::makeCurlHandle();
        if (!curl) {
            throw TransferError(ErrorKind::Generic, "Failed to allocate curl handle");
        }

        StreamContext ctx;
        ctx.owner = this;
        ctx.handle = curl.get();
        ctx.key = key;
        ctx.url = source_url;
        ctx.destination = destination;
        ctx.started = ProgressTable::Clock::now();

        char error_buffer[CURL_ERROR_SIZE] = {0};
        curl_easy_setopt(curl.get(), CURLOPT_URL, source_url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.http_timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                         static_cast<long>(options_.connect_timeout.count()));

        progress_.advance(key, 0, 0, ProgressTable::Clock::duration::zero());

        const CURLcode res = curl_easy_perform(curl.get());
        if (ctx.has_failure) {
            throw TransferError(ctx.failure_kind, ctx.failure);
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (res == CURLE_HTTP_RETURNED_ERROR) {
            throw TransferError(ErrorKind::NetworkError,
                                fmt::format("HTTP error {} while downloading {}", code, source_url));
        }
        if (res != CURLE_OK) {
            throw TransferError(ErrorKind::NetworkError,
                                fmt::format("Failed to download {}: {}", source_url,
                                            detail::describeCurlError(res, error_buffer)));
        }
        if (code < 200 || code >= 300) {
            throw TransferError(ErrorKind::NetworkError,
                                fmt::format("HTTP error {} while downloading {}", code, source_url));
        }

        // An empty 2xx body never reached the write callback.
        if (!ctx.file && !openDestination(ctx)) {
            throw TransferError(ctx.failure_kind, ctx.failure);
        }

        FILE* file = ctx.file.get();
        if (std::fflush(file) != 0 || ::fsync(fileno(file)) != 0) {
            const int err = errno;
            throw TransferError(ErrorKind::IoError,
                                fmt::format("Failed to sync {}: {}", destination.string(), std::strerror(err)));
        }
        if (std::fclose(ctx.file.release()) != 0) {
            const int err = errno;
            throw TransferError(ErrorKind::IoError,
                                fmt::format("Failed to close {}: {}", destination.string(), std::strerror(err)));
        }
    }

    bool openDestination(StreamContext& ctx) {
        ctx.file.reset(std::fopen(ctx.destination.c_str(), "wb"));
        if (!ctx.file) {
            const int err = errno;
            registerFailure(ctx, ErrorKind::IoError,
                            fmt::format("Failed to create file {}: {}", ctx.destination.string(),
                                        std::strerror(err)));
            return false;
        }
        return true;
    }

    static void registerFailure(StreamContext& ctx, ErrorKind kind, std::string message) {
        if (!ctx.has_failure) {
            ctx.has_failure = true;
            ctx.failure_kind = kind;
            ctx.failure = std::move(message);
        }
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<StreamContext*>(userdata);
        if (!ctx || !ctx->owner) {
            return 0;
        }

        Impl& self = *ctx->owner;
        const size_t total = size * nmemb;
        if (total == 0) {
            return 0;
        }

        if (!ctx->file) {
            long code = 0;
            curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &code);
            if (code < 200 || code >= 300) {
                registerFailure(*ctx, ErrorKind::NetworkError,
                                fmt::format("HTTP error {} while downloading {}", code, ctx->url));
                return 0;
            }

            curl_off_t length = -1;
            curl_easy_getinfo(ctx->handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
            //没有Content-Length时为-1, total保持0
            ctx->total_bytes = length > 0 ? static_cast<std::uint64_t>(length) : 0;

            if (!self.openDestination(*ctx)) {
                return 0;
            }
        }

        const size_t written = std::fwrite(ptr, 1, total, ctx->file.get());
        if (written != total) {
            const int err = errno;
            registerFailure(*ctx, ErrorKind::IoError,
                            fmt::format("Failed to write {}: {}", ctx->destination.string(),
                                        std::strerror(err)));
            return 0;
        }

        ctx->written_bytes += written;
        self.progress_.advance(ctx->key, ctx->written_bytes, ctx->total_bytes,
                               ProgressTable::Clock::now() - ctx->started);
        return written;
    }

    ProgressTable& progress_;
    EngineOptions options_;
};

DownloadEngine::DownloadEngine(ProgressTable& progress, EngineOptions options)
    : impl_(std::make_unique<Impl>(progress, std::move(options))) {}

DownloadEngine::~DownloadEngine() = default;

fs::path DownloadEngine::download(const std::string& source_url,
                                  std::int64_t subject_id,
                                  std::int64_t namespace_id) {
    return impl_->download(source_url, subject_id, namespace_id);
}

fs::path DownloadEngine::destinationFor(const std::string& source_url,
                                        std::int64_t subject_id,
                                        std::int64_t namespace_id) const {
    return impl_->destinationFor(source_url, subject_id, namespace_id);
}

bool DownloadEngine::removeDownloaded(std::int64_t subject_id, const fs::path& local_path) {
    return impl_->removeDownloaded(subject_id, local_path);
}

} // namespace podshuttle
