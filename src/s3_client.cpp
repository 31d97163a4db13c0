#include "s3downloader/s3_client.hpp"

#include "s3downloader/detail/curl_utils.hpp"
#include "s3downloader/detail/retry_policy.hpp"
#include "s3downloader/detail/sigv4.hpp"
#include "s3downloader/detail/xml.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace s3downloader {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kMaxErrorBody = 64 * 1024;

// A failure the next attempt of the same request may not hit.
class TransientS3Error : public S3Error {
public:
    using S3Error::S3Error;
};

struct Target {
    std::string url;
    std::string host;
    std::string canonical_uri;
};

struct ByteRange {
    std::int64_t first{0};
    std::int64_t last{0};  // inclusive

    [[nodiscard]] std::int64_t length() const noexcept { return last - first + 1; }
};

// Polled by libcurl while a request is in flight; any reason set here turns
// into CURLE_ABORTED_BY_CALLBACK.
struct AbortContext {
    const CancellationToken* token{nullptr};
    std::optional<Clock::time_point> deadline;
    const std::atomic<bool>* sibling_failed{nullptr};
};

int abortCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<const AbortContext*>(userdata);
    if (!ctx) {
        return 0;
    }
    if (ctx->token && ctx->token->isCancelled()) {
        return 1;
    }
    if (ctx->deadline && Clock::now() >= *ctx->deadline) {
        return 1;
    }
    if (ctx->sibling_failed && ctx->sibling_failed->load()) {
        return 1;
    }
    return 0;
}

struct WriteContext {
    CURL* curl{nullptr};
    std::FILE* file{nullptr};
    std::mutex* file_mutex{nullptr};
    std::int64_t offset{0};
    std::int64_t written{0};
    bool expect_partial{false};
    long status{0};
    std::string error_body;
    std::string write_error;
};

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (!ctx) {
        return 0;
    }

    const size_t total = size * nmemb;
    if (ctx->status == 0) {
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->status);
    }
    if (ctx->status >= 300) {
        if (ctx->error_body.size() < kMaxErrorBody) {
            ctx->error_body.append(ptr, total);
        }
        return total;
    }
    if (ctx->expect_partial && ctx->status != 206) {
        ctx->write_error = fmt::format("expected a partial response, got HTTP {}", ctx->status);
        return 0;
    }

    std::lock_guard<std::mutex> file_lock(*ctx->file_mutex);
    if (fseeko(ctx->file, ctx->offset + ctx->written, SEEK_SET) != 0) {
        ctx->write_error = fmt::format("failed to seek local file: {}", std::strerror(errno));
        return 0;
    }

    const size_t written = std::fwrite(ptr, 1, total, ctx->file);
    ctx->written += static_cast<std::int64_t>(written);
    if (written != total) {
        ctx->write_error = fmt::format("failed to write local file: {}", std::strerror(errno));
    }
    return written;
}

[[noreturn]] void throwHttpError(long status, const std::string& body, const std::string& context) {
    const auto parsed = detail::parseErrorBody(body);
    const std::string message = parsed.code.empty()
                                    ? fmt::format("{}: HTTP {}", context, status)
                                    : fmt::format("{}: HTTP {} {}: {}", context, status, parsed.code, parsed.message);
    if (detail::isTransientHttpError(status, parsed.code)) {
        throw TransientS3Error(message, status, parsed.code);
    }
    throw S3Error(message, status, parsed.code);
}

[[noreturn]] void throwTransportError(CURLcode code, const AbortContext& abort_ctx, const std::string& context) {
    if (code == CURLE_ABORTED_BY_CALLBACK) {
        if (abort_ctx.token && abort_ctx.token->isCancelled()) {
            throw OperationCancelled(fmt::format("{}: canceled", context));
        }
        if (abort_ctx.sibling_failed && abort_ctx.sibling_failed->load()) {
            throw S3Error(fmt::format("{}: aborted after another part failed", context));
        }
        throw S3Error(fmt::format("{}: deadline exceeded", context));
    }
    if (code == CURLE_OPERATION_TIMEDOUT) {
        throw S3Error(fmt::format("{}: deadline exceeded", context));
    }
    if (detail::isTransientCurlError(code)) {
        throw TransientS3Error(fmt::format("{}: {}", context, curl_easy_strerror(code)));
    }
    throw S3Error(fmt::format("{}: {}", context, curl_easy_strerror(code)));
}

} // namespace

class S3Client::Impl {
public:
    explicit Impl(S3ClientConfig config)
        : config_(std::move(config)),
          signer_(config_.credentials.access_key_id, config_.credentials.secret_access_key, config_.region) {
        retry_policy_.max_attempts = std::max(1, config_.max_attempts);
        if (config_.region.empty()) {
            throw std::invalid_argument("AWS region cannot be empty");
        }
        if (!config_.endpoint.empty()) {
            const auto scheme_end = config_.endpoint.find("://");
            if (scheme_end == std::string::npos) {
                throw std::invalid_argument("endpoint must include a scheme: " + config_.endpoint);
            }
            scheme_ = config_.endpoint.substr(0, scheme_end);
            const std::string rest = config_.endpoint.substr(scheme_end + 3);
            authority_ = rest.substr(0, rest.find('/'));
            if (authority_.empty()) {
                throw std::invalid_argument("endpoint has no host: " + config_.endpoint);
            }
        }
        detail::ensureCurlInitialized();
    }

    ListPage listObjects(const ListRequest& request, const CancellationToken& token) {
        std::map<std::string, std::string> params{{"list-type", "2"}};
        if (!request.prefix.empty()) {
            params["prefix"] = request.prefix;
        }
        if (!request.delimiter.empty()) {
            params["delimiter"] = request.delimiter;
        }
        if (!request.continuation_token.empty()) {
            params["continuation-token"] = request.continuation_token;
        }
        if (request.max_keys > 0) {
            params["max-keys"] = std::to_string(request.max_keys);
        }

        const Target target = makeTarget(request.bucket, {});
        const std::string query = detail::canonicalQueryString(params);
        const std::string context = fmt::format("ListObjectsV2 s3://{}/{}", request.bucket, request.prefix);

        return withRetries(context, token, std::nullopt, [&]() { return listOnce(target, query, context, token); });
    }

    std::int64_t download(const DownloadRequest& request, std::FILE* file, const CancellationToken& token) {
        if (!file) {
            throw std::invalid_argument("download requires an open file");
        }

        const Target target = makeTarget(request.bucket, request.key);
        if (request.size > request.part_size) {
            return downloadParts(target, request, file, token);
        }

        std::mutex file_mutex;
        const std::string context = fmt::format("GET s3://{}/{}", request.bucket, request.key);
        return withRetries(context, token, request.deadline, [&]() {
            // A failed attempt may have left bytes behind.
            if (std::fflush(file) != 0 || ftruncate(fileno(file), 0) == -1) {
                throw S3Error(fmt::format("cannot reset local file for '{}': {}", request.key, std::strerror(errno)));
            }
            return fetch(target, request, std::nullopt, file, file_mutex, token, nullptr);
        });
    }

    void headBucket(const std::string& bucket) {
        if (bucket.empty()) {
            throw std::invalid_argument("S3 bucket name cannot be empty");
        }

        const Target target = makeTarget(bucket, {});
        const std::string context = fmt::format("cannot access bucket '{}'", bucket);
        withRetries(context, CancellationToken{}, std::nullopt, [&]() { headOnce(target, context); });
    }

private:
    // Runs attempt until it succeeds, fails for good, or the policy runs out.
    template <typename Attempt>
    auto withRetries(const std::string& context, const CancellationToken& token,
                     std::optional<Clock::time_point> deadline, Attempt&& attempt) const -> decltype(attempt()) {
        for (int attempt_no = 1;; ++attempt_no) {
            try {
                return attempt();
            } catch (const TransientS3Error& ex) {
                if (attempt_no >= retry_policy_.max_attempts) {
                    throw;
                }
                const auto delay = detail::retryDelay(retry_policy_, attempt_no);
                spdlog::warn("{}; retrying in {} ms (attempt {} of {})", ex.what(), delay.count(), attempt_no + 1,
                             retry_policy_.max_attempts);
                if (!detail::waitBeforeRetry(delay, token, deadline)) {
                    if (token.isCancelled()) {
                        throw OperationCancelled(fmt::format("{}: canceled", context));
                    }
                    throw;
                }
            }
        }
    }

    ListPage listOnce(const Target& target, const std::string& query, const std::string& context,
                      const CancellationToken& token) const {
        auto curl = detail::makeCurlHandle();
        detail::HeaderList headers;
        sign(headers, "GET", target, query, {});

        const std::string url = target.url + "?" + query;
        std::string body;
        AbortContext abort_ctx{&token, std::nullopt, nullptr};
        applyCommonOptions(curl.get(), url, headers, abort_ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &detail::appendToString);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            throwTransportError(res, abort_ctx, context);
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (status != 200) {
            throwHttpError(status, body, context);
        }
        return detail::parseListObjectsV2(body);
    }

    void headOnce(const Target& target, const std::string& context) const {
        auto curl = detail::makeCurlHandle();
        detail::HeaderList headers;
        sign(headers, "HEAD", target, {}, {});

        AbortContext abort_ctx{nullptr, std::nullopt, nullptr};
        applyCommonOptions(curl.get(), target.url, headers, abort_ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            throwTransportError(res, abort_ctx, context);
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        switch (status) {
        case 200:
            return;
        case 301:
            throw S3Error(fmt::format("{}: bucket is in another region than {}", context, config_.region), status,
                          "PermanentRedirect");
        case 403:
            throw S3Error(fmt::format("{}: access denied", context), status, "AccessDenied");
        case 404:
            throw S3Error(fmt::format("{}: bucket does not exist", context), status, "NoSuchBucket");
        default:
            if (detail::isTransientHttpError(status, {})) {
                throw TransientS3Error(fmt::format("{}: HTTP {}", context, status), status);
            }
            throw S3Error(fmt::format("{}: HTTP {}", context, status), status);
        }
    }

    [[nodiscard]] bool useVirtualHost(const std::string& bucket) const {
        // Dotted bucket names break the wildcard TLS certificate.
        return config_.endpoint.empty() && !config_.force_path_style && bucket.find('.') == std::string::npos;
    }

    [[nodiscard]] Target makeTarget(const std::string& bucket, const std::string& key) const {
        Target target;
        const std::string encoded_key = detail::uriEncode(key, false);
        const std::string scheme = config_.endpoint.empty() ? "https" : scheme_;

        if (useVirtualHost(bucket)) {
            target.host = fmt::format("{}.s3.{}.amazonaws.com", bucket, config_.region);
            target.canonical_uri = "/" + encoded_key;
        } else {
            target.host = config_.endpoint.empty() ? fmt::format("s3.{}.amazonaws.com", config_.region) : authority_;
            target.canonical_uri = "/" + detail::uriEncode(bucket, true);
            if (!key.empty()) {
                target.canonical_uri += "/" + encoded_key;
            }
        }
        target.url = scheme + "://" + target.host + target.canonical_uri;
        return target;
    }

    void sign(detail::HeaderList& headers, const std::string& method, const Target& target,
              const std::string& canonical_query, std::map<std::string, std::string> extra_headers) const {
        detail::SigningRequest request;
        request.method = method;
        request.canonical_uri = target.canonical_uri;
        request.canonical_query = canonical_query;
        request.payload_hash = std::string{detail::kUnsignedPayload};
        request.amz_date = detail::formatAmzDate(std::time(nullptr));

        request.headers = std::move(extra_headers);
        request.headers["host"] = target.host;
        request.headers["x-amz-content-sha256"] = request.payload_hash;
        request.headers["x-amz-date"] = request.amz_date;
        if (!config_.credentials.session_token.empty()) {
            request.headers["x-amz-security-token"] = config_.credentials.session_token;
        }

        for (const auto& [name, value] : request.headers) {
            headers.add(name, value);
        }
        if (!config_.credentials.empty()) {
            headers.add("Authorization", signer_.authorization(request));
        }
    }

    void applyCommonOptions(CURL* curl, const std::string& url, const detail::HeaderList& headers,
                            AbortContext& abort_ctx) const {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &abortCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &abort_ctx);
    }

    std::int64_t fetch(const Target& target, const DownloadRequest& request, std::optional<ByteRange> range,
                       std::FILE* file, std::mutex& file_mutex, const CancellationToken& token,
                       const std::atomic<bool>* sibling_failed) const {
        const std::string context = range ? fmt::format("GET s3://{}/{} bytes {}-{}", request.bucket,
                                                        request.key, range->first, range->last)
                                          : fmt::format("GET s3://{}/{}", request.bucket, request.key);

        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(request.deadline - Clock::now());
        if (remaining.count() <= 0) {
            throw S3Error(fmt::format("{}: deadline exceeded", context));
        }

        std::map<std::string, std::string> extra;
        if (range) {
            extra["range"] = fmt::format("bytes={}-{}", range->first, range->last);
        }

        auto curl = detail::makeCurlHandle();
        detail::HeaderList headers;
        sign(headers, "GET", target, {}, std::move(extra));

        WriteContext write;
        write.curl = curl.get();
        write.file = file;
        write.file_mutex = &file_mutex;
        write.offset = range ? range->first : 0;
        write.expect_partial = range.has_value();

        AbortContext abort_ctx{&token, request.deadline, sibling_failed};
        applyCommonOptions(curl.get(), target.url, headers, abort_ctx);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(remaining.count()));
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &write);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res == CURLE_WRITE_ERROR && !write.write_error.empty()) {
            throw S3Error(fmt::format("{}: {}", context, write.write_error));
        }
        if (res != CURLE_OK) {
            throwTransportError(res, abort_ctx, context);
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (status >= 300) {
            throwHttpError(status, write.error_body, context);
        }
        if (range && write.written != range->length()) {
            throw TransientS3Error(fmt::format("{}: range download incomplete ({} of {} bytes)", context,
                                               write.written, range->length()));
        }
        return write.written;
    }

    std::int64_t downloadParts(const Target& target, const DownloadRequest& request, std::FILE* file,
                               const CancellationToken& token) const {
        if (ftruncate(fileno(file), static_cast<off_t>(request.size)) == -1) {
            throw S3Error(fmt::format("cannot resize local file for '{}': {}", request.key, std::strerror(errno)));
        }

        const std::int64_t part_size = std::max<std::int64_t>(1, request.part_size);
        const std::int64_t part_count = (request.size + part_size - 1) / part_size;
        const auto thread_count =
            static_cast<int>(std::min<std::int64_t>(std::max(1, request.part_concurrency), part_count));

        std::mutex file_mutex;
        std::atomic<std::int64_t> next_part{0};
        std::atomic<std::int64_t> written{0};
        std::atomic<bool> failed{false};
        std::mutex error_mutex;
        std::exception_ptr first_error;

        auto worker = [&]() {
            while (!failed.load()) {
                const std::int64_t part = next_part.fetch_add(1);
                if (part >= part_count) {
                    return;
                }
                const ByteRange range{part * part_size, std::min(part * part_size + part_size, request.size) - 1};
                const std::string context = fmt::format("GET s3://{}/{} bytes {}-{}", request.bucket, request.key,
                                                        range.first, range.last);
                try {
                    written += withRetries(context, token, request.deadline, [&]() {
                        return fetch(target, request, range, file, file_mutex, token, &failed);
                    });
                } catch (const std::exception&) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                    failed = true;
                    return;
                }
            }
        };

        spdlog::debug("fetching '{}' as {} parts on {} connections", request.key, part_count, thread_count);
        std::vector<std::thread> workers;
        workers.reserve(static_cast<std::size_t>(thread_count));
        auto join_all = [&workers]() {
            for (auto& thread : workers) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
        };
        try {
            for (int i = 0; i < thread_count; ++i) {
                workers.emplace_back(worker);
            }
        } catch (...) {
            // Parts already running must stop before their stack frame goes away.
            failed = true;
            join_all();
            throw;
        }
        join_all();

        if (first_error) {
            if (token.isCancelled()) {
                throw OperationCancelled(fmt::format("GET s3://{}/{}: canceled", request.bucket, request.key));
            }
            std::rethrow_exception(first_error);
        }
        return written.load();
    }

    S3ClientConfig config_;
    detail::RetryPolicy retry_policy_;
    detail::SigV4Signer signer_;
    std::string scheme_;
    std::string authority_;
};

S3Client::S3Client(S3ClientConfig config) : impl_(std::make_unique<Impl>(std::move(config))) {}

S3Client::~S3Client() = default;

ListPage S3Client::listObjects(const ListRequest& request, const CancellationToken& token) {
    return impl_->listObjects(request, token);
}

std::int64_t S3Client::download(const DownloadRequest& request, std::FILE* file, const CancellationToken& token) {
    return impl_->download(request, file, token);
}

void S3Client::headBucket(const std::string& bucket) { impl_->headBucket(bucket); }

} // namespace s3downloader
