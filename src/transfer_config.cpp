#include "s3downloader/transfer_config.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>

namespace s3downloader {

TransferConfig defaultTransferConfig() {
    TransferConfig config;
    const unsigned int cores = std::max(1u, std::thread::hardware_concurrency());
    config.max_workers = static_cast<int>(cores) * 4;
    return config;
}

void validateTransferConfig(const TransferConfig& config) {
    if (config.max_workers <= 0) {
        throw std::invalid_argument(fmt::format("max_workers must be positive, got {}", config.max_workers));
    }
    if (config.part_size <= 0) {
        throw std::invalid_argument(fmt::format("part_size must be positive, got {}", config.part_size));
    }
    if (config.part_concurrency <= 0) {
        throw std::invalid_argument(
            fmt::format("part_concurrency must be positive, got {}", config.part_concurrency));
    }
    if (config.per_object_timeout.count() <= 0) {
        throw std::invalid_argument(
            fmt::format("per_object_timeout must be positive, got {}ms", config.per_object_timeout.count()));
    }
    if (config.operation_timeout.count() < 0) {
        throw std::invalid_argument(
            fmt::format("operation_timeout cannot be negative, got {}ms", config.operation_timeout.count()));
    }
    if (config.queue_capacity == 0) {
        throw std::invalid_argument("queue_capacity must be positive");
    }
}

} // namespace s3downloader
