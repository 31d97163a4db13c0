#include "s3downloader/transfer_outcome.hpp"

#include <utility>

#include <fmt/format.h>

namespace s3downloader {

std::string_view toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Listing:
        return "listing";
    case ErrorKind::Filesystem:
        return "filesystem";
    case ErrorKind::Transfer:
        return "transfer";
    case ErrorKind::Canceled:
        return "canceled";
    }
    return "unknown";
}

std::string_view toString(TransferOutcome::Status status) {
    switch (status) {
    case TransferOutcome::Status::Success:
        return "success";
    case TransferOutcome::Status::Canceled:
        return "canceled";
    case TransferOutcome::Status::Failed:
        return "failed";
    }
    return "unknown";
}

TransferOutcome::TransferOutcome(Status status, std::optional<TransferError> first_error,
                                 std::int64_t error_count, const ProgressSnapshot& totals)
    : status_(status), first_error_(std::move(first_error)), error_count_(error_count), totals_(totals) {}

TransferOutcome TransferOutcome::success(const ProgressSnapshot& totals) {
    return TransferOutcome{Status::Success, std::nullopt, 0, totals};
}

TransferOutcome TransferOutcome::canceled(const ProgressSnapshot& totals, std::int64_t error_count) {
    return TransferOutcome{Status::Canceled, std::nullopt, error_count, totals};
}

TransferOutcome TransferOutcome::failed(TransferError first_error, std::int64_t error_count,
                                        const ProgressSnapshot& totals) {
    return TransferOutcome{Status::Failed, std::move(first_error), error_count, totals};
}

std::string TransferOutcome::summary() const {
    switch (status_) {
    case Status::Success:
        return fmt::format("Download completed: {} downloaded, {} skipped, {} bytes",
                           totals_.files_downloaded, totals_.files_skipped, totals_.total_bytes);
    case Status::Canceled:
        return "download operation canceled";
    case Status::Failed:
        return fmt::format("encountered {} errors during download. First error: {}", error_count_,
                           first_error_ ? first_error_->message : std::string{"unknown"});
    }
    return {};
}

} // namespace s3downloader
