#pragma once

#include "cancellation.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace s3downloader {

// Fixed capacity multi-producer/multi-consumer queue. Blocking operations take
// a CancellationToken and give up as soon as it fires. After close() pushes
// fail and pops drain what is left before reporting end of input.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be positive");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Blocks while the queue is full. Returns false when the queue was closed
    // or the token fired before the item could be stored.
    bool push(T item, const CancellationToken& token) {
        if (token.isCancelled()) {
            return false;
        }

        // Registered before taking mutex_ and released after it, see onCancel.
        auto registration = token.onCancel([this] { wakeAll(); });
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [&] {
            return closed_ || token.isCancelled() || items_.size() < capacity_;
        });
        if (closed_ || token.isCancelled()) {
            return false;
        }

        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Never blocks; the item is dropped when the queue is full or closed.
    bool tryPush(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || items_.size() >= capacity_) {
            return false;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Blocks while the queue is empty and open. Returns nullopt once the queue
    // is closed and drained, or as soon as the token fires.
    std::optional<T> pop(const CancellationToken& token) {
        if (token.isCancelled()) {
            return std::nullopt;
        }

        auto registration = token.onCancel([this] { wakeAll(); });
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [&] { return closed_ || token.isCancelled() || !items_.empty(); });
        if (token.isCancelled() || items_.empty()) {
            return std::nullopt;
        }

        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    void wakeAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_{false};
};

} // namespace s3downloader
