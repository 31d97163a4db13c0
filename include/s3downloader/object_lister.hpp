#pragma once

#include "error_collector.hpp"
#include "object_store.hpp"
#include "progress_aggregator.hpp"
#include "transfer_task.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

namespace s3downloader {

// Lazy walk over every object below a prefix. Pages are fetched on demand and
// the walk cannot be restarted. Directory markers are never yielded.
class ObjectListing {
public:
    ObjectListing(ObjectStore& store, std::string bucket, std::string prefix);

    // Returns nullopt at the end of the listing or once the token fired.
    // Listing failures propagate as S3Error.
    std::optional<ObjectDescriptor> next(const CancellationToken& token);

    [[nodiscard]] int pagesFetched() const noexcept { return pages_fetched_; }

private:
    void fetchPage(const CancellationToken& token);

    ObjectStore& store_;
    std::string bucket_;
    std::string prefix_;
    std::string continuation_token_;
    std::deque<ObjectDescriptor> buffered_;
    bool exhausted_{false};
    int pages_fetched_{0};
};

// Producer side of the pipeline: feeds the task queue from an ObjectListing.
class ObjectLister {
public:
    ObjectLister(ObjectStore& store, std::string bucket, std::string prefix, TaskQueue& queue,
                 ProgressAggregator& progress, ErrorCollector& errors);

    // Runs until the listing is exhausted, fails, or the token fires. Errors go
    // to the ErrorCollector; the queue is left open for the caller to close.
    void run(const CancellationToken& token);

    [[nodiscard]] std::int64_t enqueued() const noexcept { return enqueued_; }

private:
    ObjectStore& store_;
    std::string bucket_;
    std::string prefix_;
    TaskQueue& queue_;
    ProgressAggregator& progress_;
    ErrorCollector& errors_;
    std::int64_t enqueued_{0};
};

} // namespace s3downloader
