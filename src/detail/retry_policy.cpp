#include "s3downloader/detail/retry_policy.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace s3downloader::detail {

bool isTransientCurlError(CURLcode code) noexcept {
    switch (code) {
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
        return true;
    default:
        return false;
    }
}

bool isTransientHttpError(long status, std::string_view error_code) noexcept {
    if (error_code == "SlowDown" || error_code == "InternalError" || error_code == "ServiceUnavailable" ||
        error_code == "RequestTimeout") {
        return true;
    }
    return status == 500 || status == 502 || status == 503 || status == 504;
}

std::chrono::milliseconds retryDelay(const RetryPolicy& policy, int retry) {
    double delay = static_cast<double>(policy.initial_delay.count());
    for (int i = 1; i < retry; ++i) {
        delay *= policy.backoff_multiplier;
        if (delay >= static_cast<double>(policy.max_delay.count())) {
            return policy.max_delay;
        }
    }
    return std::min(std::chrono::milliseconds(static_cast<long long>(delay)), policy.max_delay);
}

bool waitBeforeRetry(std::chrono::milliseconds delay, const CancellationToken& token,
                     std::optional<std::chrono::steady_clock::time_point> deadline) {
    const auto resume_at = std::chrono::steady_clock::now() + delay;
    if (deadline && resume_at >= *deadline) {
        return false;
    }

    std::mutex mutex;
    std::condition_variable woken;
    bool cancelled = false;
    auto registration = token.onCancel([&]() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            cancelled = true;
        }
        woken.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex);
    woken.wait_until(lock, resume_at, [&cancelled]() { return cancelled; });
    return !cancelled;
}

} // namespace s3downloader::detail
