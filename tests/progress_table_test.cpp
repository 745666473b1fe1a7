#include "podshuttle/progress_table.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace podshuttle;
using namespace std::chrono_literals;

namespace {

const TransferKey kDownloadKey{42, ""};
const TransferKey kDeviceKey{42, "/media/usb0"};

} // namespace

TEST(TransferStatusTest, TransitionsAreMonotonic) {
    EXPECT_TRUE(canTransition(status::Pending{}, status::InProgress{}));
    EXPECT_TRUE(canTransition(status::InProgress{}, status::InProgress{}));
    EXPECT_TRUE(canTransition(status::InProgress{}, status::Completed{}));
    EXPECT_TRUE(canTransition(status::InProgress{}, status::Failed{"boom"}));
    EXPECT_TRUE(canTransition(status::Pending{}, status::Failed{"preflight"}));

    EXPECT_FALSE(canTransition(status::InProgress{}, status::Pending{}));
    EXPECT_FALSE(canTransition(status::Completed{}, status::InProgress{}));
    EXPECT_FALSE(canTransition(status::Failed{"x"}, status::Completed{}));
    EXPECT_FALSE(canTransition(status::Cancelled{}, status::Pending{}));
}

TEST(TransferStatusTest, NamesAndReasons) {
    EXPECT_EQ(statusName(status::Pending{}), "Pending");
    EXPECT_EQ(statusName(status::Failed{"disk full"}), "Failed");
    EXPECT_EQ(failureReason(status::Failed{"disk full"}), "disk full");
    EXPECT_TRUE(failureReason(status::Completed{}).empty());
    EXPECT_TRUE(isTerminal(status::Cancelled{}));
    EXPECT_FALSE(isTerminal(status::InProgress{}));
}

TEST(ProgressTableTest, BeginCreatesPendingEntry) {
    ProgressTable table;
    ASSERT_TRUE(table.begin(kDownloadKey));

    const auto progress = table.get(kDownloadKey);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->subject_id, 42);
    EXPECT_TRUE(progress->target_id.empty());
    EXPECT_TRUE(std::holds_alternative<status::Pending>(progress->status));
    EXPECT_EQ(progress->percentage, 0.0);
    EXPECT_FALSE(progress->eta_seconds.has_value());
}

TEST(ProgressTableTest, KeysWithSameSubjectAreIndependent) {
    ProgressTable table;
    table.begin(kDownloadKey);
    table.begin(kDeviceKey);
    table.advance(kDeviceKey, 10, 100, 1s);

    EXPECT_EQ(table.get(kDownloadKey)->transferred_bytes, 0u);
    EXPECT_EQ(table.get(kDeviceKey)->transferred_bytes, 10u);
    EXPECT_EQ(table.size(), 2u);
}

TEST(ProgressTableTest, AdvanceDerivesPercentageSpeedAndEta) {
    ProgressTable table;
    table.begin(kDeviceKey);
    ASSERT_TRUE(table.advance(kDeviceKey, 512, 1024, 2s));

    const auto progress = table.get(kDeviceKey);
    ASSERT_TRUE(progress.has_value());
    EXPECT_TRUE(std::holds_alternative<status::InProgress>(progress->status));
    EXPECT_DOUBLE_EQ(progress->percentage, 50.0);
    EXPECT_DOUBLE_EQ(progress->speed_bytes_per_sec, 256.0);
    ASSERT_TRUE(progress->eta_seconds.has_value());
    EXPECT_EQ(*progress->eta_seconds, 2u);
}

TEST(ProgressTableTest, UnknownTotalKeepsPercentageAtZero) {
    ProgressTable table;
    table.begin(kDownloadKey);
    table.advance(kDownloadKey, 4096, 0, 1s);

    const auto progress = table.get(kDownloadKey);
    EXPECT_EQ(progress->percentage, 0.0);
    EXPECT_EQ(progress->transferred_bytes, 4096u);
    EXPECT_FALSE(progress->eta_seconds.has_value());
}

TEST(ProgressTableTest, TransferredBytesNeverDecrease) {
    ProgressTable table;
    table.begin(kDownloadKey);
    table.advance(kDownloadKey, 800, 1000, 1s);
    table.advance(kDownloadKey, 300, 1000, 2s);

    EXPECT_EQ(table.get(kDownloadKey)->transferred_bytes, 800u);
}

TEST(ProgressTableTest, PercentageCappedWhenServerSendsMoreThanDeclared) {
    ProgressTable table;
    table.begin(kDownloadKey);
    table.advance(kDownloadKey, 1500, 1000, 1s);

    const auto progress = table.get(kDownloadKey);
    EXPECT_LE(progress->percentage, 100.0);
    EXPECT_LE(progress->transferred_bytes, progress->total_bytes);
}

TEST(ProgressTableTest, TerminalStateIsFinal) {
    ProgressTable table;
    table.begin(kDownloadKey);
    table.advance(kDownloadKey, 10, 100, 1s);
    ASSERT_TRUE(table.fail(kDownloadKey, "HTTP error 404"));

    EXPECT_FALSE(table.complete(kDownloadKey));
    EXPECT_FALSE(table.advance(kDownloadKey, 50, 100, 2s));

    const auto progress = table.get(kDownloadKey);
    EXPECT_EQ(failureReason(progress->status), "HTTP error 404");
    EXPECT_EQ(progress->transferred_bytes, 10u);
}

TEST(ProgressTableTest, CompleteReportsFullPercentage) {
    ProgressTable table;
    table.begin(kDownloadKey);
    table.advance(kDownloadKey, 700, 0, 1s);
    ASSERT_TRUE(table.complete(kDownloadKey));

    const auto progress = table.get(kDownloadKey);
    EXPECT_TRUE(std::holds_alternative<status::Completed>(progress->status));
    EXPECT_DOUBLE_EQ(progress->percentage, 100.0);
    EXPECT_EQ(progress->total_bytes, 700u);
    EXPECT_FALSE(progress->eta_seconds.has_value());
}

TEST(ProgressTableTest, BeginRefusesActiveEntryButRestartsFinishedOne) {
    ProgressTable table;
    ASSERT_TRUE(table.begin(kDownloadKey));
    EXPECT_TRUE(table.isActive(kDownloadKey));
    EXPECT_FALSE(table.begin(kDownloadKey));

    table.fail(kDownloadKey, "network down");
    EXPECT_FALSE(table.isActive(kDownloadKey));
    ASSERT_TRUE(table.begin(kDownloadKey));
    EXPECT_TRUE(std::holds_alternative<status::Pending>(table.get(kDownloadKey)->status));
}

TEST(ProgressTableTest, MarkAlreadyCompleteRecordsFullFile) {
    ProgressTable table;
    ASSERT_TRUE(table.markAlreadyComplete(kDownloadKey, 2048));

    const auto progress = table.get(kDownloadKey);
    ASSERT_TRUE(progress.has_value());
    EXPECT_TRUE(std::holds_alternative<status::Completed>(progress->status));
    EXPECT_DOUBLE_EQ(progress->percentage, 100.0);
    EXPECT_EQ(progress->transferred_bytes, 2048u);
}

TEST(ProgressTableTest, MarkAlreadyCompleteLeavesActiveEntryAlone) {
    ProgressTable table;
    table.begin(kDownloadKey);
    table.advance(kDownloadKey, 4096, 1000000, 1s);

    EXPECT_FALSE(table.markAlreadyComplete(kDownloadKey, 4096));
    EXPECT_TRUE(std::holds_alternative<status::InProgress>(table.get(kDownloadKey)->status));

    ASSERT_TRUE(table.fail(kDownloadKey, "connection reset"));
    EXPECT_EQ(failureReason(table.get(kDownloadKey)->status), "connection reset");

    EXPECT_TRUE(table.markAlreadyComplete(kDownloadKey, 2048));
    EXPECT_TRUE(std::holds_alternative<status::Completed>(table.get(kDownloadKey)->status));
}

TEST(ProgressTableTest, NoEtaWithoutElapsedTime) {
    ProgressTable table;
    table.begin(kDownloadKey);
    table.advance(kDownloadKey, 1000, 1000, 0s);

    const auto progress = table.get(kDownloadKey);
    EXPECT_DOUBLE_EQ(progress->speed_bytes_per_sec, 0.0);
    EXPECT_FALSE(progress->eta_seconds.has_value());

    table.advance(kDownloadKey, 1000, 1000, 1s);
    ASSERT_TRUE(table.get(kDownloadKey)->eta_seconds.has_value());
    EXPECT_EQ(*table.get(kDownloadKey)->eta_seconds, 0u);
}

TEST(ProgressTableTest, EraseSubjectRemovesAllItsEntries) {
    ProgressTable table;
    table.begin(kDownloadKey);
    table.begin(kDeviceKey);
    table.begin({7, ""});

    EXPECT_EQ(table.eraseSubject(42), 2u);
    EXPECT_FALSE(table.get(kDownloadKey).has_value());
    EXPECT_TRUE(table.get({7, ""}).has_value());
    EXPECT_FALSE(table.erase(kDeviceKey));
}

TEST(ProgressTableTest, ConcurrentReadersSeeMonotonicProgress) {
    ProgressTable table;
    table.begin(kDeviceKey);
    constexpr std::uint64_t total = 100000;

    std::atomic<bool> done{false};
    std::atomic<bool> regressed{false};
    std::thread reader([&]() {
        std::uint64_t last = 0;
        while (!done) {
            const auto progress = table.get(kDeviceKey);
            if (progress) {
                if (progress->transferred_bytes < last || progress->percentage > 100.0) {
                    regressed = true;
                }
                last = progress->transferred_bytes;
            }
        }
    });

    for (std::uint64_t sent = 0; sent <= total; sent += 1000) {
        table.advance(kDeviceKey, sent, total, 1ms * (sent / 1000 + 1));
    }
    table.complete(kDeviceKey);
    done = true;
    reader.join();

    EXPECT_FALSE(regressed);
    EXPECT_TRUE(std::holds_alternative<status::Completed>(table.get(kDeviceKey)->status));
}
