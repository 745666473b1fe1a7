#pragma once

#include "transfer_progress.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace podshuttle {

// One progress record per (subject, target) key. Each call holds the lock for a
// single lookup or update only.
class ProgressTable {
public:
    using Clock = std::chrono::steady_clock;

    // Starts a new operation: the entry is (re)created as Pending with zeroed
    // counters. Returns false and leaves the entry alone if an operation on the
    // same key is still active.
    bool begin(const TransferKey& key);

    // Publishes an InProgress update. transferred_bytes never moves backwards;
    // a smaller value is ignored. Speed and ETA are derived from the elapsed time.
    bool advance(const TransferKey& key,
                 std::uint64_t transferred_bytes,
                 std::uint64_t total_bytes,
                 Clock::duration elapsed);

    bool complete(const TransferKey& key);
    bool fail(const TransferKey& key, std::string reason);

    // Records a Completed entry at 100% without going through Pending. Used when
    // the work turns out to be already done. Refused while the key is active.
    bool markAlreadyComplete(const TransferKey& key, std::uint64_t size_bytes);

    [[nodiscard]] std::optional<TransferProgress> get(const TransferKey& key) const;
    [[nodiscard]] bool isActive(const TransferKey& key) const;
    [[nodiscard]] std::vector<TransferProgress> snapshot() const;
    [[nodiscard]] std::size_t size() const;

    bool erase(const TransferKey& key);
    std::size_t eraseSubject(std::int64_t subject_id);

private:
    bool transition(const TransferKey& key, TransferStatus next);

    mutable std::mutex mutex_;
    std::map<TransferKey, TransferProgress> entries_;
};

} // namespace podshuttle
