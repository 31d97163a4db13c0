#pragma once

#include "s3downloader/cancellation.hpp"

#include <chrono>
#include <optional>
#include <string_view>

#include <curl/curl.h>

namespace s3downloader::detail {

// Attempts of a single S3 request. Three in total, as the AWS SDKs do.
struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds initial_delay{200};
    double backoff_multiplier{2.0};
    std::chrono::milliseconds max_delay{2000};
};

// Connection level failures that a fresh connection may not hit again.
// Aborts and timeouts are never transient.
[[nodiscard]] bool isTransientCurlError(CURLcode code) noexcept;

// Server side failures and throttling. error_code is the <Code> of the
// error body, empty when there was none.
[[nodiscard]] bool isTransientHttpError(long status, std::string_view error_code) noexcept;

// Delay before retry number `retry`, counted from 1.
[[nodiscard]] std::chrono::milliseconds retryDelay(const RetryPolicy& policy, int retry);

// Sleeps for delay. Returns false without sleeping it out when the token
// fires, or when the deadline would pass before the next attempt starts.
[[nodiscard]] bool waitBeforeRetry(std::chrono::milliseconds delay, const CancellationToken& token,
                                   std::optional<std::chrono::steady_clock::time_point> deadline);

} // namespace s3downloader::detail
