#include "podshuttle/transfer_manager.hpp"

#include "podshuttle/errors.hpp"

#include <algorithm>
#include <exception>
#include <ostream>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace podshuttle {

TransferManager::TransferManager(const ProgressTable& progress, std::ostream& out)
    : progress_(progress), out_(out) {}

void TransferManager::addTask(TransferTaskPtr task) {
    if (task) {
        tasks_.push_back(std::move(task));
    }
}

void TransferManager::start() {
    finished_ = 0;
    threads_.reserve(tasks_.size());
    for (auto& task : tasks_) {
        threads_.emplace_back([this, task]() { runTask(task); });
    }

    if (panel_enabled_) {
        renderProgressLoop();
    }

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void TransferManager::runTask(const TransferTaskPtr& task) {
    try {
        task->start();
    } catch (const TransferError& ex) {
        std::lock_guard<std::mutex> lock(failures_mutex_);
        failures_.push_back({task->label(), fmt::format("{}: {}", errorKindName(ex.kind()), ex.what())});
    } catch (const std::exception& ex) {
        spdlog::error("Unexpected failure in {}: {}", task->label(), ex.what());
        std::lock_guard<std::mutex> lock(failures_mutex_);
        failures_.push_back({task->label(), ex.what()});
    }
    ++finished_;
}

void TransferManager::renderProgressLoop() {
    std::size_t previous_lines = 0;
    while (true) {
        // Sampled before drawing so the last frame always shows final states.
        const bool active = hasActiveTasks();
        redrawPanel(buildProgressPanel(), previous_lines);
        if (!active) {
            break;
        }
        std::this_thread::sleep_for(refresh_interval_);
    }

    out_ << std::flush;
}

std::string TransferManager::buildProgressPanel() const {
    std::string panel;
    panel.reserve(tasks_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("Transfers ({} tasks)\n", tasks_.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t transferred_all = 0;

    for (const auto& task : tasks_) {
        const auto progress = progress_.get(task->key());
        panel += formatTaskLine(task->label(), progress ? &*progress : nullptr);
        panel.push_back('\n');

        if (progress) {
            total_all += progress->total_bytes;
            transferred_all += progress->transferred_bytes;
        }
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        const double ratio = static_cast<double>(transferred_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(std::min(1.0, ratio) * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string TransferManager::formatTaskLine(const std::string& label, const TransferProgress* progress) {
    std::string display_name = label.empty() ? "(unnamed)" : label;
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }

    if (!progress) {
        return fmt::format("{:<20} [Waiting...]", display_name);
    }

    std::string line;
    line.reserve(256);
    if (progress->total_bytes > 0) {
        const double ratio = std::min(1.0, progress->percentage / 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})",
                            display_name,
                            bar,
                            static_cast<int>(progress->percentage),
                            formatSize(progress->transferred_bytes),
                            formatSize(progress->total_bytes));
    } else {
        line += fmt::format("{:<20} [{}]", display_name,
                            progress->transferred_bytes > 0 ? formatSize(progress->transferred_bytes)
                                                            : std::string{"Initializing..."});
    }

    if (const auto* failed = std::get_if<status::Failed>(&progress->status)) {
        line += fmt::format("  ❌ {}", failed->reason);
    } else if (std::holds_alternative<status::Completed>(progress->status)) {
        line.append("  ✅ Done");
    } else if (std::holds_alternative<status::Cancelled>(progress->status)) {
        line.append("  Cancelled");
    } else if (progress->speed_bytes_per_sec > 0.0) {
        line += fmt::format("  {}/s", formatSize(static_cast<std::uint64_t>(progress->speed_bytes_per_sec)));
        if (progress->eta_seconds) {
            line += fmt::format(" ETA {}s", *progress->eta_seconds);
        }
    }

    return line;
}

std::string TransferManager::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

bool TransferManager::hasActiveTasks() const {
    return finished_.load() < tasks_.size();
}

void TransferManager::redrawPanel(const std::string& panel, std::size_t& previous_lines) {
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines > 0) {
        out_ << "\033[" << previous_lines << "F\033[J";
    }
    out_ << panel;
    previous_lines = current_lines;
}

std::vector<TaskFailure> TransferManager::failures() const {
    std::lock_guard<std::mutex> lock(failures_mutex_);
    return failures_;
}

void TransferManager::printErrors(std::ostream& err) const {
    for (const auto& failure : failures()) {
        err << fmt::format("{}: {}", failure.label, failure.message) << '\n';
    }
}

} // namespace podshuttle
