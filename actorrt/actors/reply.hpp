#pragma once

#include <memory>
#include <optional>

#include <actorrt/corochain.hpp>
#include <actorrt/sync.hpp>

namespace NActorRt {
namespace NActors {

/**
 * @brief One-shot channel for request/reply between actors and host code.
 *
 * The channel is a cheap copyable handle, so it can travel inside a message:
 * @code
 * struct TGetBalance {
 *     static constexpr TMessageId MessageId = 300;
 *     TReplyChannel<int64_t> Reply;
 * };
 *
 * TReplyChannel<int64_t> reply(poller);
 * system.Send(account, TGetBalance{reply});
 * auto balance = co_await reply.Receive(DeadlineAfter(std::chrono::seconds(1)));
 * @endcode
 * The first Reply() wins; later ones return false.
 */
template<typename T>
class TReplyChannel {
public:
    explicit TReplyChannel(TPollerBase* poller)
        : State_(std::make_shared<TState>(poller))
    { }

    bool Reply(T value) const {
        if (State_->Replied) {
            return false;
        }
        State_->Replied = true;
        State_->Value = std::move(value);
        State_->Waiters.NotifyAll();
        return true;
    }

    bool Ready() const {
        return State_->Value.has_value();
    }

    /// Waits for the reply until @p deadline; empty on timeout or if already taken.
    TFuture<std::optional<T>> Receive(TTime deadline = Never) const {
        auto state = State_;
        while (!state->Value && !state->Replied) {
            if (!co_await state->Waiters.WaitUntil(deadline)) {
                break;
            }
        }
        co_return std::exchange(state->Value, std::nullopt);
    }

private:
    struct TState {
        explicit TState(TPollerBase* poller)
            : Waiters(poller)
        { }

        std::optional<T> Value;
        TWaitList Waiters;
        bool Replied = false;
    };

    std::shared_ptr<TState> State_;
};

} // namespace NActors
} // namespace NActorRt
