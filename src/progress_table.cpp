#include "podshuttle/progress_table.hpp"

#include <algorithm>
#include <utility>

namespace podshuttle {

namespace {

double computePercentage(std::uint64_t transferred, std::uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    const double ratio = static_cast<double>(transferred) / static_cast<double>(total);
    return std::min(100.0, ratio * 100.0);
}

} // namespace

bool ProgressTable::begin(const TransferKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && !isTerminal(it->second.status)) {
        return false;
    }

    TransferProgress fresh;
    fresh.subject_id = key.subject_id;
    fresh.target_id = key.target_id;
    entries_[key] = std::move(fresh);
    return true;
}

bool ProgressTable::advance(const TransferKey& key,
                            std::uint64_t transferred_bytes,
                            std::uint64_t total_bytes,
                            Clock::duration elapsed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }

    TransferProgress& progress = it->second;
    if (!canTransition(progress.status, status::InProgress{})) {
        return false;
    }

    progress.status = status::InProgress{};
    progress.transferred_bytes = std::max(progress.transferred_bytes, transferred_bytes);
    // A server that sends more than it declared must not push us past 100%.
    progress.total_bytes = total_bytes > 0 ? std::max(total_bytes, progress.transferred_bytes) : 0;
    total_bytes = progress.total_bytes;
    progress.percentage = computePercentage(progress.transferred_bytes, total_bytes);

    const double seconds = std::chrono::duration<double>(elapsed).count();
    progress.speed_bytes_per_sec =
        seconds > 0.0 ? static_cast<double>(progress.transferred_bytes) / seconds : 0.0;

    if (progress.speed_bytes_per_sec > 0.0 && total_bytes > progress.transferred_bytes) {
        const double remaining = static_cast<double>(total_bytes - progress.transferred_bytes);
        progress.eta_seconds = static_cast<std::uint64_t>(remaining / progress.speed_bytes_per_sec);
    } else if (progress.speed_bytes_per_sec > 0.0 && total_bytes > 0) {
        progress.eta_seconds = 0;
    } else {
        progress.eta_seconds.reset();
    }
    return true;
}

bool ProgressTable::complete(const TransferKey& key) {
    return transition(key, status::Completed{});
}

bool ProgressTable::fail(const TransferKey& key, std::string reason) {
    return transition(key, status::Failed{std::move(reason)});
}

bool ProgressTable::markAlreadyComplete(const TransferKey& key, std::uint64_t size_bytes) {
    TransferProgress done;
    done.subject_id = key.subject_id;
    done.target_id = key.target_id;
    done.total_bytes = size_bytes;
    done.transferred_bytes = size_bytes;
    done.percentage = 100.0;
    done.status = status::Completed{};

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && !isTerminal(it->second.status)) {
        return false;
    }
    entries_[key] = std::move(done);
    return true;
}

std::optional<TransferProgress> ProgressTable::get(const TransferKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ProgressTable::isActive(const TransferKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && !isTerminal(it->second.status);
}

std::vector<TransferProgress> ProgressTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferProgress> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.second);
    }
    return out;
}

std::size_t ProgressTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool ProgressTable::erase(const TransferKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

std::size_t ProgressTable::eraseSubject(std::int64_t subject_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.subject_id == subject_id) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool ProgressTable::transition(const TransferKey& key, TransferStatus next) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }

    TransferProgress& progress = it->second;
    if (!canTransition(progress.status, next)) {
        return false;
    }

    if (std::holds_alternative<status::Completed>(next)) {
        if (progress.total_bytes < progress.transferred_bytes) {
            progress.total_bytes = progress.transferred_bytes;
        }
        progress.percentage = 100.0;
    }
    progress.eta_seconds.reset();
    progress.status = std::move(next);
    return true;
}

} // namespace podshuttle
