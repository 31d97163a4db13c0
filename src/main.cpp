#include "s3downloader/cancellation.hpp"
#include "s3downloader/cli_options.hpp"
#include "s3downloader/detail/curl_utils.hpp"
#include "s3downloader/progress_console.hpp"
#include "s3downloader/s3_client.hpp"
#include "s3downloader/transfer_engine.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace cli = s3downloader::cli;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitCanceled = 130;

std::atomic<bool> g_interrupted{false};

extern "C" void onInterrupt(int) { g_interrupted.store(true); }

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <bucket> <destination>" << std::endl;
    std::cerr << "Options:\n"
              << "  -p <prefix>      Only download keys starting with prefix\n"
              << "  -r <region>      AWS region (default: $AWS_REGION, $AWS_DEFAULT_REGION, us-east-1)\n"
              << "  -e <endpoint>    S3 compatible endpoint URL, uses path-style addressing\n"
              << "  -w <workers>     Concurrent object downloads (default: 4 x CPU threads)\n"
              << "  -s <MiB>         Part size for ranged downloads (default: 10)\n"
              << "  -c <parts>       Parts fetched in parallel per object (default: 10)\n"
              << "  -T <seconds>     Deadline per object (default: 1800)\n"
              << "  -D <seconds>     Deadline for the whole run (default: none)\n"
              << "  -o               Overwrite files that already exist\n"
              << "  -l               List sub-prefixes of the prefix and exit\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message\n"
              << "Credentials are read from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and AWS_SESSION_TOKEN."
              << std::endl;
}

std::string envOr(const char* name, std::string fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string{value} : std::move(fallback);
}

// Turns SIGINT into a cancellation request; signal handlers cannot take locks.
class InterruptWatcher {
public:
    explicit InterruptWatcher(s3downloader::CancellationSource source) : source_(std::move(source)) {
        std::signal(SIGINT, onInterrupt);
        thread_ = std::thread([this]() {
            while (!done_.load()) {
                if (g_interrupted.load()) {
                    spdlog::warn("interrupt received, canceling download");
                    source_.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    }

    ~InterruptWatcher() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
        std::signal(SIGINT, SIG_DFL);
    }

private:
    s3downloader::CancellationSource source_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace

int main(int argc, char** argv) {
    try {
        // Logs go to stderr, stdout carries the progress panel.
        spdlog::set_default_logger(spdlog::stderr_color_mt("s3downloader"));
        spdlog::set_level(spdlog::level::info);
        s3downloader::detail::ensureCurlInitialized();

        s3downloader::S3ClientConfig client_config;
        client_config.region = envOr("AWS_REGION", envOr("AWS_DEFAULT_REGION", "us-east-1"));
        client_config.credentials.access_key_id = envOr("AWS_ACCESS_KEY_ID", {});
        client_config.credentials.secret_access_key = envOr("AWS_SECRET_ACCESS_KEY", {});
        client_config.credentials.session_token = envOr("AWS_SESSION_TOKEN", {});

        s3downloader::TransferConfig config = s3downloader::defaultTransferConfig();
        std::string prefix;
        bool overwrite = false;
        bool list_only = false;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (option == "-o") {
                overwrite = true;
                ++arg_index;
                continue;
            } else if (option == "-l") {
                list_only = true;
                ++arg_index;
                continue;
            } else if (option == "-v") {
                spdlog::set_level(spdlog::level::debug);
                ++arg_index;
                continue;
            }

            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return kExitFailure;
            }
            const std::string value = argv[arg_index + 1];

            if (option == "-p") {
                prefix = value;
            } else if (option == "-r") {
                client_config.region = value;
            } else if (option == "-e") {
                client_config.endpoint = value;
                client_config.force_path_style = true;
            } else if (option == "-w") {
                config.max_workers = static_cast<int>(cli::parseBoundedOption(option, value, cli::kMaxWorkers));
            } else if (option == "-s") {
                const long mib = cli::parseBoundedOption(option, value, cli::kMaxPartSizeMiB);
                config.part_size = static_cast<std::int64_t>(mib) * 1024 * 1024;
            } else if (option == "-c") {
                config.part_concurrency =
                    static_cast<int>(cli::parseBoundedOption(option, value, cli::kMaxPartConcurrency));
            } else if (option == "-T") {
                config.per_object_timeout =
                    std::chrono::seconds(cli::parseBoundedOption(option, value, cli::kMaxTimeoutSeconds));
            } else if (option == "-D") {
                config.operation_timeout =
                    std::chrono::seconds(cli::parseBoundedOption(option, value, cli::kMaxTimeoutSeconds));
            } else {
                printUsage(argv[0]);
                return kExitFailure;
            }
            arg_index += 2;
        }

        const int positional = argc - arg_index;
        if ((list_only && positional != 1) || (!list_only && positional != 2)) {
            printUsage(argv[0]);
            return kExitFailure;
        }
        const std::string bucket = argv[arg_index];

        if (client_config.credentials.empty()) {
            spdlog::warn("no AWS credentials in the environment, sending anonymous requests");
        }
        auto store = std::make_shared<s3downloader::S3Client>(client_config);

        if (list_only) {
            for (const auto& common_prefix : store->listPrefixes(bucket, prefix)) {
                fmt::print("{}\n", common_prefix);
            }
            return 0;
        }

        const std::filesystem::path destination = argv[arg_index + 1];
        store->headBucket(bucket);

        s3downloader::CancellationSource cancellation;
        InterruptWatcher interrupt_watcher{cancellation};

        s3downloader::ProgressStream progress{16};
        s3downloader::ProgressConsole console{fmt::format("s3://{}/{} -> {}", bucket, prefix, destination.string()),
                                              std::cout};
        std::thread console_thread([&console, &progress]() { console.consume(progress); });

        s3downloader::TransferEngine engine{store};
        const auto outcome = [&]() {
            try {
                return engine.run(bucket, prefix, destination, overwrite, config, &progress, cancellation.token());
            } catch (...) {
                progress.close();
                console_thread.join();
                throw;
            }
        }();
        progress.close();
        console_thread.join();

        switch (outcome.status()) {
        case s3downloader::TransferOutcome::Status::Success:
            fmt::print("{}\n", outcome.summary());
            return 0;
        case s3downloader::TransferOutcome::Status::Canceled:
            fmt::print("{}\n", outcome.summary());
            return kExitCanceled;
        case s3downloader::TransferOutcome::Status::Failed:
            spdlog::error("{}", outcome.summary());
            return kExitFailure;
        }
        return kExitFailure;
    } catch (const std::exception& ex) {
        spdlog::error("Fatal error: {}", ex.what());
        return kExitFailure;
    }
}
