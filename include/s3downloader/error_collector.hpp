#pragma once

#include "bounded_queue.hpp"
#include "progress_aggregator.hpp"
#include "transfer_error.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace s3downloader {

// Merges errors from the lister and the workers. Only the first `capacity`
// errors are kept for reporting, but every error is counted.
class ErrorCollector {
public:
    ErrorCollector(std::size_t capacity, ProgressAggregator& progress);

    // Never blocks.
    void report(TransferError error);

    // Called once every producer has stopped.
    void close();

    // Retained errors in arrival order; call after close().
    [[nodiscard]] std::vector<TransferError> drain();

    [[nodiscard]] std::int64_t errorCount() const noexcept { return count_.load(); }

private:
    BoundedQueue<TransferError> retained_;
    std::atomic<std::int64_t> count_{0};
    ProgressAggregator& progress_;
};

} // namespace s3downloader
