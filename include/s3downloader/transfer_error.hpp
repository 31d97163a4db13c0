#pragma once

#include <string>
#include <string_view>

namespace s3downloader {

enum class ErrorKind {
    Listing,
    Filesystem,
    Transfer,
    // A transfer that was already running when the run was canceled.
    Canceled,
};

[[nodiscard]] std::string_view toString(ErrorKind kind);

struct TransferError {
    ErrorKind kind{ErrorKind::Transfer};
    std::string key;      // empty for listing errors
    std::string message;  // complete, human readable
};

} // namespace s3downloader
