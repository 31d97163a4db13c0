#include "s3downloader/error_collector.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace s3downloader {

ErrorCollector::ErrorCollector(std::size_t capacity, ProgressAggregator& progress)
    : retained_(capacity), progress_(progress) {}

void ErrorCollector::report(TransferError error) {
    count_.fetch_add(1);
    progress_.recordError();

    spdlog::warn("{} error: {}", toString(error.kind), error.message);
    if (!retained_.tryPush(std::move(error))) {
        spdlog::debug("error buffer full, keeping count only");
    }

    progress_.publish();
}

void ErrorCollector::close() { retained_.close(); }

std::vector<TransferError> ErrorCollector::drain() {
    std::vector<TransferError> errors;
    errors.reserve(retained_.size());
    while (auto error = retained_.tryPop()) {
        errors.push_back(std::move(*error));
    }
    return errors;
}

} // namespace s3downloader
