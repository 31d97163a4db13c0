#pragma once

#include "object_store.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace s3downloader {

struct AwsCredentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;

    [[nodiscard]] bool empty() const noexcept { return access_key_id.empty() || secret_access_key.empty(); }
};

struct S3ClientConfig {
    std::string region{"us-east-1"};
    // Base URL of an S3 compatible service, e.g. http://localhost:9000. Empty
    // means AWS with virtual-hosted addressing.
    std::string endpoint;
    bool force_path_style{false};
    // Requests are sent unsigned when empty.
    AwsCredentials credentials;
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
    // Attempts per request, transient failures only.
    int max_attempts{3};
};

class S3Client final : public ObjectStore {
public:
    explicit S3Client(S3ClientConfig config);
    ~S3Client() override;

    [[nodiscard]] ListPage listObjects(const ListRequest& request, const CancellationToken& token) override;
    std::int64_t download(const DownloadRequest& request, std::FILE* file, const CancellationToken& token) override;
    void headBucket(const std::string& bucket) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace s3downloader
