#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <variant>

namespace podshuttle {

namespace status {

struct Pending {};
struct InProgress {};
struct Completed {};
struct Failed {
    std::string reason;
};
struct Cancelled {};

} // namespace status

using TransferStatus = std::variant<status::Pending,
                                    status::InProgress,
                                    status::Completed,
                                    status::Failed,
                                    status::Cancelled>;

[[nodiscard]] bool isTerminal(const TransferStatus& status);
[[nodiscard]] std::string statusName(const TransferStatus& status);

// Empty unless the status is Failed.
[[nodiscard]] std::string failureReason(const TransferStatus& status);

// Pending -> InProgress -> {Completed | Failed | Cancelled}. Pending may jump
// straight to a terminal state; InProgress may be re-entered to publish updates.
[[nodiscard]] bool canTransition(const TransferStatus& from, const TransferStatus& to);

// A download is keyed by episode id alone (empty target); a device transfer by
// episode id and device path.
struct TransferKey {
    std::int64_t subject_id{0};
    std::string target_id;

    bool operator<(const TransferKey& other) const {
        return std::tie(subject_id, target_id) < std::tie(other.subject_id, other.target_id);
    }
    bool operator==(const TransferKey& other) const {
        return subject_id == other.subject_id && target_id == other.target_id;
    }
};

struct TransferProgress {
    std::int64_t subject_id{0};
    std::string target_id;
    std::uint64_t total_bytes{0};
    std::uint64_t transferred_bytes{0};
    double percentage{0.0};
    double speed_bytes_per_sec{0.0};
    std::optional<std::uint64_t> eta_seconds;
    TransferStatus status{status::Pending{}};

    [[nodiscard]] TransferKey key() const { return {subject_id, target_id}; }
};

} // namespace podshuttle
