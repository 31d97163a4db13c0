#include "s3downloader/object_lister.hpp"

#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace s3downloader {

ObjectListing::ObjectListing(ObjectStore& store, std::string bucket, std::string prefix)
    : store_(store), bucket_(std::move(bucket)), prefix_(std::move(prefix)) {}

std::optional<ObjectDescriptor> ObjectListing::next(const CancellationToken& token) {
    while (buffered_.empty()) {
        if (exhausted_ || token.isCancelled()) {
            return std::nullopt;
        }
        fetchPage(token);
    }

    ObjectDescriptor object = std::move(buffered_.front());
    buffered_.pop_front();
    return object;
}

void ObjectListing::fetchPage(const CancellationToken& token) {
    ListRequest request;
    request.bucket = bucket_;
    request.prefix = prefix_;
    request.continuation_token = continuation_token_;

    ListPage page = store_.listObjects(request, token);
    ++pages_fetched_;

    for (auto& object : page.objects) {
        if (isDirectoryMarker(object)) {
            continue;
        }
        buffered_.push_back(std::move(object));
    }

    if (page.truncated && !page.next_continuation_token.empty()) {
        continuation_token_ = std::move(page.next_continuation_token);
    } else {
        exhausted_ = true;
    }
    spdlog::debug("listed page {} of s3://{}/{} ({} objects)", pages_fetched_, bucket_, prefix_,
                  buffered_.size());
}

ObjectLister::ObjectLister(ObjectStore& store, std::string bucket, std::string prefix, TaskQueue& queue,
                           ProgressAggregator& progress, ErrorCollector& errors)
    : store_(store),
      bucket_(std::move(bucket)),
      prefix_(std::move(prefix)),
      queue_(queue),
      progress_(progress),
      errors_(errors) {}

void ObjectLister::run(const CancellationToken& token) {
    ObjectListing listing{store_, bucket_, prefix_};
    try {
        while (auto object = listing.next(token)) {
            if (!queue_.push(std::move(*object), token)) {
                return;
            }
            ++enqueued_;
            progress_.recordFound();
            progress_.publish();
        }
    } catch (const OperationCancelled&) {
        spdlog::debug("listing of s3://{}/{} canceled", bucket_, prefix_);
    } catch (const std::exception& ex) {
        errors_.report({ErrorKind::Listing, {}, fmt::format("error listing objects: {}", ex.what())});
    }
}

} // namespace s3downloader
