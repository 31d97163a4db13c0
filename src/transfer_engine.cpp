#include "s3downloader/transfer_engine.hpp"

#include "s3downloader/download_worker_pool.hpp"
#include "s3downloader/error_collector.hpp"
#include "s3downloader/file_utils.hpp"
#include "s3downloader/object_lister.hpp"
#include "s3downloader/progress_aggregator.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace s3downloader {

namespace {

// Cancels source when timeout elapses before the watchdog is stopped.
class DeadlineWatchdog {
public:
    DeadlineWatchdog(CancellationSource source, std::chrono::milliseconds timeout)
        : source_(std::move(source)) {
        if (timeout.count() > 0) {
            thread_ = std::thread([this, timeout]() {
                std::unique_lock<std::mutex> lock(mutex_);
                if (!stopped_cv_.wait_for(lock, timeout, [this] { return stopped_; })) {
                    spdlog::warn("operation deadline of {}ms expired, canceling", timeout.count());
                    source_.cancel();
                }
            });
        }
    }

    ~DeadlineWatchdog() { stop(); }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        stopped_cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    CancellationSource source_;
    std::mutex mutex_;
    std::condition_variable stopped_cv_;
    bool stopped_{false};
    std::thread thread_;
};

} // namespace

TransferEngine::TransferEngine(ObjectStorePtr store) : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("TransferEngine requires an object store");
    }
}

TransferOutcome TransferEngine::run(const std::string& bucket, const std::string& prefix,
                                    const std::filesystem::path& destination_root, bool overwrite,
                                    const TransferConfig& config, ProgressStream* progress_sink,
                                    const CancellationToken& token) {
    if (bucket.empty()) {
        throw std::invalid_argument("S3 bucket name cannot be empty");
    }
    if (destination_root.empty()) {
        throw std::invalid_argument("download path cannot be empty");
    }
    validateTransferConfig(config);

    if (!fileutils::fileExists(destination_root)) {
        if (const auto ec = fileutils::ensureDirectoryExists(destination_root)) {
            TransferError error{ErrorKind::Filesystem, {},
                                fmt::format("download path doesn't exist and couldn't be created: {}",
                                            ec.message())};
            return TransferOutcome::failed(std::move(error), 1, ProgressSnapshot{});
        }
    }

    // The caller's token and the operation deadline both feed this source;
    // everything below observes only its token.
    CancellationSource source;
    auto caller_link = token.onCancel([source]() mutable { source.cancel(); });
    DeadlineWatchdog watchdog{source, config.operation_timeout};
    const CancellationToken run_token = source.token();

    spdlog::info("downloading s3://{}/{} to {} with {} workers", bucket, prefix, destination_root.string(),
                 config.max_workers);

    ProgressAggregator progress{progress_sink};
    ErrorCollector errors{static_cast<std::size_t>(config.max_workers), progress};
    TaskQueue queue{config.queue_capacity};

    DownloadWorkerPool pool{*store_, bucket, destination_root, overwrite, config, progress, errors};
    ObjectLister lister{*store_, bucket, prefix, queue, progress, errors};

    std::thread lister_thread;
    try {
        pool.start(queue, run_token);
        lister_thread = std::thread([&lister, &queue, run_token]() {
            lister.run(run_token);
            // End of input for the workers, also after a listing failure.
            queue.close();
        });
    } catch (...) {
        // Workers would otherwise wait forever on a queue nobody closes.
        source.cancel();
        queue.close();
        pool.wait();
        throw;
    }

    lister_thread.join();
    pool.wait();
    watchdog.stop();

    const bool canceled = run_token.isCancelled();
    errors.close();
    std::vector<TransferError> collected = errors.drain();
    const std::int64_t error_count = errors.errorCount();

    progress.publish();
    const ProgressSnapshot totals = progress.snapshot();

    if (canceled) {
        spdlog::info("download of s3://{}/{} canceled", bucket, prefix);
        return TransferOutcome::canceled(totals, error_count);
    }
    if (error_count > 0 && !collected.empty()) {
        spdlog::info("download of s3://{}/{} finished with {} errors", bucket, prefix, error_count);
        return TransferOutcome::failed(std::move(collected.front()), error_count, totals);
    }

    spdlog::info("download of s3://{}/{} finished: {} downloaded, {} skipped, {} bytes", bucket, prefix,
                 totals.files_downloaded, totals.files_skipped, totals.total_bytes);
    return TransferOutcome::success(totals);
}

} // namespace s3downloader
