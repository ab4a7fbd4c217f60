#pragma once
#include <coroutine>

namespace NActorRt {

struct TVoidPromise;

/// Fire-and-forget coroutine: starts eagerly and frees its frame on completion.
struct TVoidTask : std::coroutine_handle<TVoidPromise>
{
    using promise_type = TVoidPromise;
};

struct TVoidPromise
{
    TVoidTask get_return_object() { return { TVoidTask::from_promise(*this) }; }
    std::suspend_never initial_suspend() { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void return_void() {}
    void unhandled_exception() { throw; }
};

/**
 * @class Self
 * @brief Awaitable that yields the handle of the awaiting coroutine without suspending it.
 *
 * @code{.cpp}
 * auto self = co_await Self();
 * poller->AddTimer(deadline, self);
 * co_await std::suspend_always();
 * @endcode
 */
struct Self {
    bool await_ready() {
        return false;
    }

    bool await_suspend(std::coroutine_handle<> h) {
        H = h;
        return false;
    }

    auto await_resume() noexcept {
        return H;
    }

    std::coroutine_handle<> H;
};

} // namespace NActorRt
