#pragma once

#include "error_collector.hpp"
#include "object_store.hpp"
#include "progress_aggregator.hpp"
#include "transfer_config.hpp"
#include "transfer_task.hpp"

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace s3downloader {

enum class ObjectResult {
    Downloaded,
    Skipped,
    Failed,
    Canceled,
};

class DownloadWorkerPool {
public:
    DownloadWorkerPool(ObjectStore& store, std::string bucket, std::filesystem::path destination_root,
                       bool overwrite, const TransferConfig& config, ProgressAggregator& progress,
                       ErrorCollector& errors);
    ~DownloadWorkerPool();

    DownloadWorkerPool(const DownloadWorkerPool&) = delete;
    DownloadWorkerPool& operator=(const DownloadWorkerPool&) = delete;

    // Spawns config.max_workers threads consuming queue. queue must outlive wait().
    void start(TaskQueue& queue, const CancellationToken& token);

    // Joins every worker. Returns once the queue was closed and drained, or
    // the token fired and each worker finished its current object.
    void wait();

    // Everything one worker does for one object: path resolution, directory
    // creation, skip decision and transfer.
    ObjectResult processObject(const ObjectDescriptor& object, const CancellationToken& token);

private:
    void workerLoop(TaskQueue& queue, const CancellationToken& token);
    ObjectResult transfer(const ObjectDescriptor& object, const std::filesystem::path& local_path,
                          const CancellationToken& token);

    ObjectStore& store_;
    std::string bucket_;
    std::filesystem::path destination_root_;
    bool overwrite_;
    const TransferConfig& config_;
    ProgressAggregator& progress_;
    ErrorCollector& errors_;

    std::vector<std::thread> threads_;
};

} // namespace s3downloader
