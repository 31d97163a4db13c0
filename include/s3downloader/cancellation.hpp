#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace s3downloader {

namespace detail {
struct CancellationState;
} // namespace detail

// Thrown by transports when an operation unwinds because its token fired.
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& what = "operation canceled")
        : std::runtime_error(what) {}
};

class CancellationRegistration {
public:
    CancellationRegistration() = default;
    ~CancellationRegistration();

    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;
    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    void reset();

private:
    friend class CancellationToken;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, std::uint64_t id);

    std::shared_ptr<detail::CancellationState> state_;
    std::uint64_t id_{0};
};

// Observer side. A default constructed token is never cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool isCancelled() const noexcept;

    // The callback runs on the thread calling cancel(), or immediately when the
    // token has already fired. It must not destroy its own registration.
    [[nodiscard]] CancellationRegistration onCancel(std::function<void()> callback) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state);

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    void cancel();
    [[nodiscard]] bool isCancelled() const noexcept;
    [[nodiscard]] CancellationToken token() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace s3downloader
