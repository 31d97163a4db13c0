#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace s3downloader {

struct TransferConfig {
    int max_workers{16};
    std::int64_t part_size{10 * 1024 * 1024};
    int part_concurrency{10};
    std::chrono::milliseconds per_object_timeout{std::chrono::minutes(30)};
    // Zero disables the overall deadline.
    std::chrono::milliseconds operation_timeout{0};
    std::size_t queue_capacity{1000};
};

// Four workers per hardware thread, 10 MiB parts, 10 parts in flight, 30 minute
// per-object deadline.
[[nodiscard]] TransferConfig defaultTransferConfig();

// Throws std::invalid_argument naming the first field out of range.
void validateTransferConfig(const TransferConfig& config);

} // namespace s3downloader
