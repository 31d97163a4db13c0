#pragma once

#include "cancellation.hpp"
#include "transfer_task.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace s3downloader {

class S3Error : public std::runtime_error {
public:
    explicit S3Error(const std::string& message, long http_status = 0, std::string code = {})
        : std::runtime_error(message), http_status_(http_status), code_(std::move(code)) {}

    // Zero when the request never produced an HTTP response.
    [[nodiscard]] long httpStatus() const noexcept { return http_status_; }
    [[nodiscard]] const std::string& code() const noexcept { return code_; }

private:
    long http_status_;
    std::string code_;
};

struct ListRequest {
    std::string bucket;
    std::string prefix;
    std::string delimiter;
    std::string continuation_token;
    int max_keys{1000};
};

struct ListPage {
    std::vector<ObjectDescriptor> objects;
    std::vector<std::string> common_prefixes;
    std::string next_continuation_token;
    bool truncated{false};
};

struct DownloadRequest {
    std::string bucket;
    std::string key;
    std::int64_t size{0};
    std::chrono::steady_clock::time_point deadline;
    std::int64_t part_size{10 * 1024 * 1024};
    int part_concurrency{1};
};

// Already authenticated client of a remote object store. Implementations
// report failures by throwing S3Error, and OperationCancelled when the
// token fires mid-request.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    [[nodiscard]] virtual ListPage listObjects(const ListRequest& request, const CancellationToken& token) = 0;

    // Writes the object into file, which is open for writing and empty.
    // Returns the number of bytes written.
    virtual std::int64_t download(const DownloadRequest& request, std::FILE* file,
                                  const CancellationToken& token) = 0;

    // Throws when the bucket does not exist or is not accessible.
    virtual void headBucket(const std::string& bucket) = 0;

    // Common prefixes directly below prefix, using "/" as delimiter.
    [[nodiscard]] std::vector<std::string> listPrefixes(const std::string& bucket, const std::string& prefix,
                                                        const CancellationToken& token = {});
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace s3downloader
