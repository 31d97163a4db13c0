#include "s3downloader/download_worker_pool.hpp"

#include "s3downloader/file_utils.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace s3downloader {

namespace {

struct FileDeleter {
    void operator()(std::FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<std::FILE, FileDeleter>;

void removePartialFile(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::warn("failed to remove partial file '{}': {}", path.string(), ec.message());
    }
}

} // namespace

DownloadWorkerPool::DownloadWorkerPool(ObjectStore& store, std::string bucket,
                                       std::filesystem::path destination_root, bool overwrite,
                                       const TransferConfig& config, ProgressAggregator& progress,
                                       ErrorCollector& errors)
    : store_(store),
      bucket_(std::move(bucket)),
      destination_root_(std::move(destination_root)),
      overwrite_(overwrite),
      config_(config),
      progress_(progress),
      errors_(errors) {}

DownloadWorkerPool::~DownloadWorkerPool() { wait(); }

void DownloadWorkerPool::start(TaskQueue& queue, const CancellationToken& token) {
    threads_.reserve(threads_.size() + static_cast<std::size_t>(config_.max_workers));
    for (int i = 0; i < config_.max_workers; ++i) {
        threads_.emplace_back([this, &queue, token]() { workerLoop(queue, token); });
    }
}

void DownloadWorkerPool::wait() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void DownloadWorkerPool::workerLoop(TaskQueue& queue, const CancellationToken& token) {
    while (auto object = queue.pop(token)) {
        processObject(*object, token);
    }
}

ObjectResult DownloadWorkerPool::processObject(const ObjectDescriptor& object, const CancellationToken& token) {
    std::filesystem::path local_path;
    try {
        local_path = fileutils::resolveLocalPath(destination_root_, object.key);
    } catch (const std::invalid_argument& ex) {
        errors_.report({ErrorKind::Filesystem, object.key, ex.what()});
        return ObjectResult::Failed;
    }

    if (const auto ec = fileutils::ensureDirectoryExists(local_path.parent_path())) {
        errors_.report({ErrorKind::Filesystem, object.key,
                        fmt::format("failed to create directory for '{}': {}", object.key, ec.message())});
        return ObjectResult::Failed;
    }

    if (!overwrite_ && fileutils::fileExists(local_path)) {
        spdlog::debug("skipping '{}', {} already exists", object.key, local_path.string());
        progress_.recordSkipped();
        progress_.publish();
        return ObjectResult::Skipped;
    }

    return transfer(object, local_path, token);
}

ObjectResult DownloadWorkerPool::transfer(const ObjectDescriptor& object, const std::filesystem::path& local_path,
                                          const CancellationToken& token) {
    if (token.isCancelled()) {
        return ObjectResult::Canceled;
    }

    FilePtr file{std::fopen(local_path.c_str(), "wb")};
    if (!file) {
        const std::error_code ec{errno, std::generic_category()};
        errors_.report({ErrorKind::Filesystem, object.key,
                        fmt::format("failed to create file '{}': {}", object.key, ec.message())});
        return ObjectResult::Failed;
    }

    DownloadRequest request;
    request.bucket = bucket_;
    request.key = object.key;
    request.size = object.size;
    request.deadline = std::chrono::steady_clock::now() + config_.per_object_timeout;
    request.part_size = config_.part_size;
    request.part_concurrency = config_.part_concurrency;

    spdlog::debug("downloading '{}' ({} bytes)", object.key, object.size);
    try {
        store_.download(request, file.get(), token);
        if (std::fflush(file.get()) != 0 || std::ferror(file.get())) {
            throw std::system_error(errno, std::generic_category(), "failed to flush local file");
        }
        if (std::fclose(file.release()) != 0) {
            throw std::system_error(errno, std::generic_category(), "failed to close local file");
        }
    } catch (const OperationCancelled&) {
        file.reset();
        removePartialFile(local_path);
        spdlog::debug("download of '{}' canceled", object.key);
        errors_.report({ErrorKind::Canceled, object.key, fmt::format("download of '{}' canceled", object.key)});
        return ObjectResult::Canceled;
    } catch (const std::exception& ex) {
        file.reset();
        removePartialFile(local_path);
        errors_.report({ErrorKind::Transfer, object.key,
                        fmt::format("failed to download '{}': {}", object.key, ex.what())});
        return ObjectResult::Failed;
    }

    progress_.recordTransferred(object.size);
    progress_.publish();
    spdlog::debug("downloaded '{}'", object.key);
    return ObjectResult::Downloaded;
}

} // namespace s3downloader
