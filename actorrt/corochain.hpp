#pragma once

/**
 * @file corochain.hpp
 * @brief Futures for eagerly started coroutines.
 *
 * A coroutine returning TFuture<T> runs until its first suspension as soon as it
 * is called. Awaiting the future registers the caller, which is resumed when the
 * coroutine finishes; the result or the exception is then taken from the promise.
 * Destroying a future whose coroutine has not finished destroys the coroutine
 * frame, which is how the runtime cancels work (forced actor termination,
 * expired start timeouts).
 *
 * @code
 * TFuture<int> Answer(TPollerBase* poller) {
 *     co_await poller->Sleep(std::chrono::milliseconds(10));
 *     co_return 42;
 * }
 *
 * TFuture<void> Caller(TPollerBase* poller) {
 *     auto value = co_await WithDeadline(poller, Answer(poller), DeadlineAfter(std::chrono::seconds(1)));
 *     if (!value) {
 *         // timed out, Answer() was cancelled
 *     }
 * }
 * @endcode
 */

#include <coroutine>
#include <optional>
#include <expected>
#include <exception>
#include <utility>
#include <vector>

#include "promises.hpp"
#include "poller.hpp"

namespace NActorRt {

template<typename T> struct TFinalAwaiter;

template<typename T> struct TFuture;

template<typename T>
struct TPromiseBase {
    std::suspend_never initial_suspend() { return {}; }
    TFinalAwaiter<T> final_suspend() noexcept;
    /// Resumed on completion; a no-op until somebody awaits the future.
    std::coroutine_handle<> Caller = std::noop_coroutine();
};

template<typename T>
struct TPromise: public TPromiseBase<T> {
    TFuture<T> get_return_object();

    void return_value(const T& t) {
        ErrorOr = t;
    }

    void return_value(T&& t) {
        ErrorOr = std::move(t);
    }

    void unhandled_exception() {
        ErrorOr = std::unexpected(std::current_exception());
    }

    std::optional<std::expected<T, std::exception_ptr>> ErrorOr;
};

template<typename T>
struct TFutureBase {
    TFutureBase() = default;
    TFutureBase(TPromise<T>& promise)
        : Coro(Coro.from_promise(promise))
    { }
    TFutureBase(TFutureBase&& other)
    {
        *this = std::move(other);
    }
    TFutureBase(const TFutureBase&) = delete;
    TFutureBase& operator=(const TFutureBase&) = delete;
    TFutureBase& operator=(TFutureBase&& other) {
        if (this != &other) {
            if (Coro) {
                Coro.destroy();
            }
            Coro = std::exchange(other.Coro, nullptr);
        }
        return *this;
    }

    ~TFutureBase() { if (Coro) { Coro.destroy(); } }

    bool await_ready() const {
        return Coro.promise().ErrorOr.has_value();
    }

    bool done() const {
        return Coro.done();
    }

    bool valid() const {
        return static_cast<bool>(Coro);
    }

    void await_suspend(std::coroutine_handle<> caller) {
        Coro.promise().Caller = caller;
    }

    using promise_type = TPromise<T>;

protected:
    std::coroutine_handle<TPromise<T>> Coro = nullptr;
};

template<> struct TFuture<void>;

template<typename T>
struct TFuture : public TFutureBase<T> {
    T await_resume() {
        auto& errorOr = *this->Coro.promise().ErrorOr;
        if (errorOr.has_value()) {
            return std::move(errorOr.value());
        } else {
            std::rethrow_exception(errorOr.error());
        }
    }
};

template<>
struct TPromise<void>: public TPromiseBase<void> {
    TFuture<void> get_return_object();

    void return_void() {
        ErrorOr = nullptr;
    }

    void unhandled_exception() {
        ErrorOr = std::current_exception();
    }

    std::optional<std::exception_ptr> ErrorOr;
};

template<>
struct TFuture<void> : public TFutureBase<void> {
    void await_resume() {
        auto& errorOr = *this->Coro.promise().ErrorOr;
        if (errorOr) {
            std::rethrow_exception(errorOr);
        }
    }
};

/**
 * @brief Final awaiter: transfers control to the awaiting coroutine.
 */
template<typename T>
struct TFinalAwaiter {
    bool await_ready() noexcept { return false; }
    std::coroutine_handle<> await_suspend(std::coroutine_handle<TPromise<T>> h) noexcept {
        return h.promise().Caller;
    }
    void await_resume() noexcept { }
};

inline TFuture<void> TPromise<void>::get_return_object() { return { TFuture<void>{*this} }; }
template<typename T>
TFuture<T> TPromise<T>::get_return_object() { return { TFuture<T>{*this} }; }

template<typename T>
TFinalAwaiter<T> TPromiseBase<T>::final_suspend() noexcept { return {}; }

/**
 * @brief Awaits the completion of all void-returning coroutines, in order.
 *
 * The first exception is rethrown after every future has finished.
 */
inline TFuture<void> All(std::vector<TFuture<void>>&& futures) {
    auto waiting = std::move(futures);
    std::exception_ptr first;
    for (auto& f : waiting) {
        try {
            co_await f;
        } catch (...) {
            if (!first) {
                first = std::current_exception();
            }
        }
    }
    if (first) {
        std::rethrow_exception(first);
    }
}

namespace NDetail {

// Removes the timer unless it fired, also when the awaiting frame is destroyed.
class TDeadlineTimer {
public:
    TDeadlineTimer(TPollerBase* poller, TTime deadline, THandle h)
        : Poller_(poller)
        , Deadline_(deadline)
        , Id_(poller->AddTimer(deadline, h))
    { }

    ~TDeadlineTimer() {
        if (Poller_) {
            Poller_->RemoveTimer(Id_, Deadline_);
        }
    }

    TDeadlineTimer(const TDeadlineTimer&) = delete;
    TDeadlineTimer& operator=(const TDeadlineTimer&) = delete;

    void Fired() {
        Poller_ = nullptr;
    }

private:
    TPollerBase* Poller_;
    TTime Deadline_;
    unsigned Id_;
};

} // namespace NDetail

/**
 * @brief Awaits @p future until @p deadline.
 *
 * @return true when the future finished in time (its exception, if any, is
 * rethrown), false when the deadline passed first. In the latter case the
 * unfinished coroutine is destroyed before this returns.
 */
inline TFuture<bool> WithDeadline(TPollerBase* poller, TFuture<void> future, TTime deadline) {
    if (!future.done()) {
        if (deadline == Never) {
            co_await future;
            co_return true;
        }
        auto self = co_await Self();
        future.await_suspend(self);
        NDetail::TDeadlineTimer timer(poller, deadline, self);
        co_await std::suspend_always();
        if (!future.done()) {
            timer.Fired();
            auto expired = std::move(future);
            co_return false;
        }
    }
    future.await_resume();
    co_return true;
}

/**
 * @brief Awaits a value-returning @p future until @p deadline.
 *
 * @return The value, or std::nullopt when the deadline passed first.
 */
template<typename T>
TFuture<std::optional<T>> WithDeadline(TPollerBase* poller, TFuture<T> future, TTime deadline) {
    if (!future.done()) {
        if (deadline == Never) {
            co_return std::optional<T>(co_await future);
        }
        auto self = co_await Self();
        future.await_suspend(self);
        NDetail::TDeadlineTimer timer(poller, deadline, self);
        co_await std::suspend_always();
        if (!future.done()) {
            timer.Fired();
            auto expired = std::move(future);
            co_return std::nullopt;
        }
    }
    co_return std::optional<T>(future.await_resume());
}

} // namespace NActorRt
