#pragma once

#include "progress.hpp"

#include <atomic>
#include <cstdint>

namespace s3downloader {

// Per-invocation counter set shared by the lister and every worker. Counters
// only grow and are updated with single atomic operations; snapshots are not
// taken under a common lock and may mix values from racing updates.
class ProgressAggregator {
public:
    // stream may be null, in which case publish() is a no-op.
    explicit ProgressAggregator(ProgressStream* stream = nullptr) noexcept : stream_(stream) {}

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    void recordFound() noexcept;
    void recordTransferred(std::int64_t bytes) noexcept;
    void recordSkipped() noexcept;
    void recordError() noexcept;

    [[nodiscard]] ProgressSnapshot snapshot() const noexcept;

    // Non-blocking. Returns false when the snapshot was dropped because the
    // stream was full, closed or absent.
    bool publish();

private:
    ProgressStream* stream_;

    std::atomic<std::int64_t> found_{0};
    std::atomic<std::int64_t> processed_{0};  // transfers plus skips
    std::atomic<std::int64_t> skipped_{0};
    std::atomic<std::int64_t> bytes_{0};
    std::atomic<std::int64_t> errors_{0};
};

} // namespace s3downloader
