#pragma once

/// @file cancellation_token.hpp
/// @brief Cooperative cancellation: CancellationSource, CancellationToken and
///        linked tokens.
///
/// A CancellationSource owns a cancellation flag and hands out cheap
/// CancellationToken copies that observe it. Work checks the token at its
/// suspension points (waitFor, isCancelled) and unwinds by returning an
/// OperationCancelled result. Nothing is ever forcibly terminated.

#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <vector>

#include "cgc/foundation/client_result.hpp"

namespace cgc::async {

namespace detail {
struct CancellationState;
} // namespace detail

/// RAII handle for a callback registered with CancellationToken::onCancel().
/// Destroying it unregisters the callback. If the callback is running on
/// another thread at that moment, reset() blocks until it returns, so the
/// callback may safely capture objects that own the registration. Safe to
/// outlive the source.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}
    ~CancellationRegistration() { reset(); }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    void reset();

private:
    std::weak_ptr<detail::CancellationState> state_;
    uint64_t id_ = 0;
};

/// Observer side of a cancellation flag. Copyable and thread-safe.
///
/// A default-constructed token can never be cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    /// Token that is never cancelled.
    static CancellationToken none() { return CancellationToken(); }

    [[nodiscard]] bool isCancelled() const noexcept;

    /// False for none(); such a token needs no checks.
    [[nodiscard]] bool canBeCancelled() const noexcept { return state_ != nullptr; }

    /// Block up to @p timeout or until cancelled.
    /// @return true if the token was cancelled (before or during the wait).
    bool waitFor(std::chrono::milliseconds timeout) const;

    /// Block until cancelled. Never returns for none().
    void wait() const;

    /// Run @p callback once on cancellation, or immediately on the calling
    /// thread if already cancelled. Callbacks run outside internal locks.
    [[nodiscard]] CancellationRegistration onCancel(std::function<void()> callback) const;

    /// OperationCancelled error if cancelled, success otherwise.
    [[nodiscard]] foundation::ClientResult<void> checkpoint() const;

    friend bool operator==(const CancellationToken& a, const CancellationToken& b) noexcept {
        return a.state_ == b.state_;
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/// Owner side of a cancellation flag.
///
/// Example:
/// @code
///   CancellationSource session;
///   auto link = CancellationSource::linked({session.token(), appToken});
///   runner.submit("recv", [t = link.token()] {
///       while (!t.isCancelled()) { pump(); }
///   });
///   session.cancel();   // also cancels link
/// @endcode
class CancellationSource {
public:
    CancellationSource();

    /// A source that is additionally cancelled when any of @p parents is.
    /// The new source keeps the parents' state alive, so a parent may itself
    /// be a temporary linked token.
    static CancellationSource linked(std::initializer_list<CancellationToken> parents);
    static CancellationSource linked(const std::vector<CancellationToken>& parents);

    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }

    /// Cancel and run registered callbacks. Idempotent; only the first call
    /// runs callbacks.
    void cancel();

    [[nodiscard]] bool isCancelled() const noexcept;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

/// Shorthand for the OperationCancelled error result.
template <typename T>
[[nodiscard]] foundation::ClientResult<T> cancelledResult(std::string what = "operation cancelled") {
    return foundation::makeError<T>(foundation::ErrorCode::OperationCancelled, std::move(what));
}

} // namespace cgc::async
