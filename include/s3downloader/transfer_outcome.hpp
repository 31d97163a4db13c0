#pragma once

#include "progress.hpp"
#include "transfer_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace s3downloader {

class TransferOutcome {
public:
    enum class Status {
        Success,
        Canceled,
        Failed,
    };

    static TransferOutcome success(const ProgressSnapshot& totals);
    static TransferOutcome canceled(const ProgressSnapshot& totals, std::int64_t error_count);
    static TransferOutcome failed(TransferError first_error, std::int64_t error_count,
                                  const ProgressSnapshot& totals);

    [[nodiscard]] Status status() const noexcept { return status_; }
    [[nodiscard]] bool ok() const noexcept { return status_ == Status::Success; }
    [[nodiscard]] const std::optional<TransferError>& firstError() const noexcept { return first_error_; }
    [[nodiscard]] std::int64_t errorCount() const noexcept { return error_count_; }
    [[nodiscard]] const ProgressSnapshot& totals() const noexcept { return totals_; }

    // One line suitable for a status bar or the last line of a CLI run.
    [[nodiscard]] std::string summary() const;

private:
    TransferOutcome(Status status, std::optional<TransferError> first_error, std::int64_t error_count,
                    const ProgressSnapshot& totals);

    Status status_;
    std::optional<TransferError> first_error_;
    std::int64_t error_count_;
    ProgressSnapshot totals_;
};

[[nodiscard]] std::string_view toString(TransferOutcome::Status status);

} // namespace s3downloader
