#pragma once

#include "transfer_task.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace podshuttle {

struct TaskFailure {
    std::string label;
    std::string message;
};

// Runs every added task on its own thread and, unless disabled, redraws a
// progress panel built from the shared ProgressTable until all tasks finish.
class TransferManager {
public:
    TransferManager(const ProgressTable& progress, std::ostream& out);

    void addTask(TransferTaskPtr task);
    void start();

    void setPanelEnabled(bool enabled) { panel_enabled_ = enabled; }
    void setRefreshInterval(std::chrono::milliseconds interval) { refresh_interval_ = interval; }

    [[nodiscard]] std::vector<TaskFailure> failures() const;
    void printErrors(std::ostream& err) const;

    static std::string formatTaskLine(const std::string& label, const TransferProgress* progress);
    static std::string formatSize(std::uint64_t bytes);

private:
    void runTask(const TransferTaskPtr& task);
    void renderProgressLoop();
    std::string buildProgressPanel() const;
    bool hasActiveTasks() const;
    void redrawPanel(const std::string& panel, std::size_t& previous_lines);

    const ProgressTable& progress_;
    std::ostream& out_;
    bool panel_enabled_{true};
    std::chrono::milliseconds refresh_interval_{200};

    std::vector<std::thread> threads_;
    std::vector<TransferTaskPtr> tasks_;
    std::atomic<std::size_t> finished_{0};

    mutable std::mutex failures_mutex_;
    std::vector<TaskFailure> failures_;
};

} // namespace podshuttle
