#include "podshuttle/detail/curl_utils.hpp"
#include "podshuttle/device_removal_engine.hpp"
#include "podshuttle/device_transfer_engine.hpp"
#include "podshuttle/download_engine.hpp"
#include "podshuttle/errors.hpp"
#include "podshuttle/options.hpp"
#include "podshuttle/progress_table.hpp"
#include "podshuttle/reconciliation_engine.hpp"
#include "podshuttle/transfer_manager.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <command> [arguments]\n"
              << "Commands:\n"
              << "  download <episode-id> <podcast-id> <url> [...]\n"
              << "  transfer <episode-id> <local-file> <device-root> <filename> [...]\n"
              << "  remove <device-root> <filename>\n"
              << "  verify <device-root> [<filename>...]\n"
              << "  scan <device-root>\n"
              << "Options:\n"
              << "  -d <directory>   Download directory (default: ./episodes)\n"
              << "  -n <name>        Directory used on devices (default: PodShuttle)\n"
              << "  -t <seconds>     Timeout for a whole download (default: 300)\n"
              << "  -q               Do not draw the progress panel\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

std::int64_t parseId(const std::string& text, const char* what) {
    try {
        std::size_t used = 0;
        const long long value = std::stoll(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return static_cast<std::int64_t>(value);
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid {}: {}", what, text));
    }
}

// Treats file names given on the command line as the episodes expected on the
// device.
class ListedEpisodeStore final : public podshuttle::EpisodeStore {
public:
    explicit ListedEpisodeStore(const std::vector<std::string>& filenames) {
        std::int64_t next_id = 1;
        for (const auto& name : filenames) {
            podshuttle::EpisodeRecord record;
            record.id = next_id++;
            record.local_file_path = name;
            record.downloaded = true;
            record.on_device = true;
            records_.push_back(std::move(record));
        }
    }

    std::vector<podshuttle::EpisodeRecord> onDeviceEpisodes() const override { return records_; }

    void setOnDevice(std::int64_t episode_id, bool on_device) override {
        for (auto& record : records_) {
            if (record.id == episode_id) {
                record.on_device = on_device;
            }
        }
    }

private:
    std::vector<podshuttle::EpisodeRecord> records_;
};

// Consumed arguments must come in groups of `arity`.
bool hasGroups(int remaining, int arity) {
    return remaining >= arity && remaining % arity == 0;
}

int runTasks(podshuttle::TransferManager& manager) {
    manager.start();
    const auto failures = manager.failures();
    if (!failures.empty()) {
        manager.printErrors(std::cerr);
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        podshuttle::detail::ensureCurlInitialized();
        spdlog::set_level(spdlog::level::warn);

        podshuttle::EngineOptions options;
        bool show_panel = true;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-d" || option == "-n" || option == "-t") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }
                const std::string value = argv[arg_index + 1];
                if (option == "-d") {
                    options.download_root = value;
                } else if (option == "-n") {
                    options.device_namespace = value;
                } else {
                    const auto seconds = parseId(value, "timeout");
                    if (seconds <= 0) {
                        throw std::runtime_error("Timeout must be positive.");
                    }
                    options.http_timeout = std::chrono::seconds{seconds};
                }
                arg_index += 2;
            } else if (option == "-q") {
                show_panel = false;
                ++arg_index;
            } else if (option == "-v") {
                spdlog::set_level(spdlog::level::debug);
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (arg_index >= argc) {
            printUsage(argv[0]);
            return 1;
        }
        const std::string command = argv[arg_index++];
        const int remaining = argc - arg_index;

        podshuttle::ProgressTable progress;

        if (command == "download") {
            if (!hasGroups(remaining, 3)) {
                printUsage(argv[0]);
                return 1;
            }
            podshuttle::DownloadEngine engine(progress, options);
            podshuttle::TransferManager manager(progress, std::cout);
            manager.setPanelEnabled(show_panel);
            std::vector<std::shared_ptr<podshuttle::DownloadTask>> downloads;
            for (int i = arg_index; i < argc; i += 3) {
                auto task = std::make_shared<podshuttle::DownloadTask>(
                    engine, argv[i + 2], parseId(argv[i], "episode id"), parseId(argv[i + 1], "podcast id"));
                downloads.push_back(task);
                manager.addTask(std::move(task));
            }
            const int status = runTasks(manager);
            for (const auto& task : downloads) {
                if (!task->localPath().empty()) {
                    std::cout << task->localPath().string() << '\n';
                }
            }
            return status;
        }

        if (command == "transfer") {
            if (!hasGroups(remaining, 4)) {
                printUsage(argv[0]);
                return 1;
            }
            podshuttle::DeviceTransferEngine engine(progress, options);
            podshuttle::TransferManager manager(progress, std::cout);
            manager.setPanelEnabled(show_panel);
            for (int i = arg_index; i < argc; i += 4) {
                manager.addTask(std::make_shared<podshuttle::DeviceCopyTask>(
                    engine, parseId(argv[i], "episode id"), argv[i + 1], argv[i + 2], argv[i + 3]));
            }
            return runTasks(manager);
        }

        if (command == "remove") {
            if (remaining != 2) {
                printUsage(argv[0]);
                return 1;
            }
            podshuttle::DeviceRemovalEngine engine(options);
            engine.remove(argv[arg_index], argv[arg_index + 1]);
            return 0;
        }

        if (command == "verify" || command == "scan") {
            if (remaining < 1 || (command == "scan" && remaining != 1)) {
                printUsage(argv[0]);
                return 1;
            }
            const std::filesystem::path device_root = argv[arg_index];
            ListedEpisodeStore store(std::vector<std::string>(argv + arg_index + 1, argv + argc));
            podshuttle::ReconciliationEngine engine(store, options);

            if (command == "scan") {
                for (const auto& file : engine.scan(device_root)) {
                    std::cout << fmt::format("{:<40} {:>10}", file.filename,
                                             podshuttle::TransferManager::formatSize(file.size_bytes))
                              << '\n';
                }
                return 0;
            }

            const auto report = engine.verify(device_root, engine.expectedFilenames());
            std::cout << fmt::format("Files on device:      {}\n", report.files_found)
                      << fmt::format("Expected episodes:    {}\n", report.database_episodes);
            for (const auto& name : report.missing_from_device) {
                std::cout << "  missing from device:   " << name << '\n';
            }
            for (const auto& name : report.missing_from_database) {
                std::cout << "  unknown to database:   " << name << '\n';
            }
            std::cout << (report.is_consistent ? "Consistent" : "Inconsistent") << std::endl;
            return report.is_consistent ? 0 : 2;
        }

        printUsage(argv[0]);
        return 1;
    } catch (const podshuttle::TransferError& ex) {
        std::cerr << "Error (" << podshuttle::errorKindName(ex.kind()) << "): " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
