#include "s3downloader/cancellation.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <utility>

namespace s3downloader {

namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::map<std::uint64_t, std::function<void()>> callbacks;
    std::uint64_t next_id{1};
};

} // namespace detail

CancellationRegistration::CancellationRegistration(std::shared_ptr<detail::CancellationState> state,
                                                   std::uint64_t id)
    : state_(std::move(state)), id_(id) {}

CancellationRegistration::~CancellationRegistration() { reset(); }

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (state_) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

CancellationToken::CancellationToken(std::shared_ptr<detail::CancellationState> state)
    : state_(std::move(state)) {}

bool CancellationToken::isCancelled() const noexcept {
    return state_ && state_->cancelled.load();
}

CancellationRegistration CancellationToken::onCancel(std::function<void()> callback) const {
    if (!state_ || !callback) {
        return {};
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled.load()) {
            const auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration{state_, id};
        }
    }

    callback();
    return {};
}

CancellationSource::CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

void CancellationSource::cancel() {
    // Callbacks run under the state mutex so that a registration cannot be
    // released (and its target destroyed) while its callback is running.
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled.exchange(true)) {
        return;
    }
    for (auto& entry : state_->callbacks) {
        entry.second();
    }
    state_->callbacks.clear();
}

bool CancellationSource::isCancelled() const noexcept { return state_->cancelled.load(); }

CancellationToken CancellationSource::token() const { return CancellationToken{state_}; }

} // namespace s3downloader
