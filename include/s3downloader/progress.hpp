#pragma once

#include "bounded_queue.hpp"

#include <cstdint>

namespace s3downloader {

struct ProgressSnapshot {
    std::int64_t files_found{0};
    std::int64_t files_downloaded{0};
    std::int64_t files_skipped{0};
    std::int64_t total_bytes{0};
    std::int64_t error_count{0};
};

inline bool operator==(const ProgressSnapshot& lhs, const ProgressSnapshot& rhs) {
    return lhs.files_found == rhs.files_found && lhs.files_downloaded == rhs.files_downloaded &&
           lhs.files_skipped == rhs.files_skipped && lhs.total_bytes == rhs.total_bytes &&
           lhs.error_count == rhs.error_count;
}

inline bool operator!=(const ProgressSnapshot& lhs, const ProgressSnapshot& rhs) { return !(lhs == rhs); }

// Bounded monitoring channel from the engine to whoever renders progress.
using ProgressStream = BoundedQueue<ProgressSnapshot>;

} // namespace s3downloader
