#include "s3downloader/progress_aggregator.hpp"

namespace s3downloader {

void ProgressAggregator::recordFound() noexcept { found_.fetch_add(1); }

void ProgressAggregator::recordTransferred(std::int64_t bytes) noexcept {
    processed_.fetch_add(1);
    bytes_.fetch_add(bytes);
}

void ProgressAggregator::recordSkipped() noexcept {
    // processed_ first: processed_ >= skipped_ holds at every instant.
    processed_.fetch_add(1);
    skipped_.fetch_add(1);
}

void ProgressAggregator::recordError() noexcept { errors_.fetch_add(1); }

ProgressSnapshot ProgressAggregator::snapshot() const noexcept {
    ProgressSnapshot snapshot;
    // skipped_ before processed_ so the net download count never goes negative.
    snapshot.files_skipped = skipped_.load();
    const std::int64_t processed = processed_.load();
    snapshot.files_found = found_.load();
    snapshot.files_downloaded = processed - snapshot.files_skipped;
    snapshot.total_bytes = bytes_.load();
    snapshot.error_count = errors_.load();
    return snapshot;
}

bool ProgressAggregator::publish() {
    if (!stream_) {
        return false;
    }
    return stream_->tryPush(snapshot());
}

} // namespace s3downloader
