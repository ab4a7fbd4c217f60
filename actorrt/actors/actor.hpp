#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <actorrt/corochain.hpp>
#include <actorrt/log.hpp>

#include "address.hpp"
#include "broker.hpp"
#include "envelope.hpp"
#include "errors.hpp"
#include "health.hpp"

/**
 * @file actor.hpp
 * @brief Actor interface, per-actor context and typed message dispatch.
 *
 * An actor owns its state and sees one message at a time. Handlers are
 * coroutines, so a handler may suspend (sleep, send into a full mailbox,
 * wait for a reply); the next message is not taken until it finishes.
 *
 * @section simple_actor Simple actor
 * @code
 * class TCounter : public IActor {
 * public:
 *     TFuture<void> Receive(TEnvelope envelope, TActorContext& ctx) override {
 *         if (envelope.Message.Is<TIncrement>()) {
 *             Value_ += envelope.Message.As<TIncrement>().Delta;
 *         }
 *         co_return;
 *     }
 *
 * private:
 *     int64_t Value_ = 0;
 * };
 * @endcode
 *
 * @section behavior_actor Typed dispatch
 * @code
 * class TCache : public TBehaviorActor<TCache, TPut, TGet> {
 * public:
 *     void Receive(const TPut& put, TActorContext& ctx) {
 *         Items_[put.Key] = put.Value;
 *     }
 *
 *     TFuture<void> Receive(const TGet& get, TActorContext& ctx) {
 *         co_await ctx.Sleep(std::chrono::milliseconds(1));
 *         get.Reply.Reply(Items_[get.Key]);
 *     }
 * };
 * @endcode
 */

namespace NActorRt {
namespace NActors {

class TActorSystem;
class IActor;

/// What the execution loop does after a handler failed.
enum class EErrorAction {
    Resume,   // drop the message, keep going
    Stop,     // stop this actor, normal exit
    Restart,  // fresh instance, restart counted
    Escalate  // abnormal exit, the supervisor decides
};

std::string_view ToString(EErrorAction action);

/// Options for TActorContext::Spawn and TActorSystem::Spawn.
struct TSpawnOptions {
    /// Empty for an anonymous actor.
    std::string Name;
    /// System default when unset.
    std::optional<TMailboxConfig> Mailbox;
    /// System default when unset.
    std::optional<std::chrono::milliseconds> StartTimeout;
};

/**
 * @brief The actor's view of the runtime.
 *
 * One context lives as long as the actor's execution cell and survives
 * in-place restarts. The metadata accessors (Sender(), ReplyTo(),
 * CorrelationId()) describe the envelope being handled right now.
 */
class TActorContext {
public:
    TActorContext(TActorSystem* system, TActorAddress self);

    TActorContext(const TActorContext&) = delete;
    TActorContext& operator=(const TActorContext&) = delete;

    const TActorAddress& Self() const {
        return Self_;
    }

    const std::optional<TActorAddress>& Sender() const {
        return Sender_;
    }

    const std::optional<TActorAddress>& ReplyTo() const {
        return ReplyTo_;
    }

    std::optional<TCorrelationId> CorrelationId() const {
        return CorrelationId_;
    }

    uint64_t MessagesProcessed() const {
        return MessagesProcessed_;
    }

    TTime StartedAt() const {
        return StartedAt_;
    }

    uint32_t RestartCount() const {
        return RestartCount_;
    }

    /// Sets the sender to Self() unless the envelope already has one.
    TSendResult Send(const TActorAddress& to, TEnvelope envelope);

    template<typename T>
        requires CMessage<std::decay_t<T>>
    TSendResult Send(const TActorAddress& to, T&& message) {
        return Send(to, TEnvelope::Of(std::forward<T>(message)));
    }

    /// Like Send(), but suspends while the recipient's mailbox is full under EBackpressure::Block.
    TFuture<TSendResult> SendAsync(TActorAddress to, TEnvelope envelope);

    template<typename T>
        requires CMessage<std::decay_t<T>>
    TFuture<TSendResult> SendAsync(TActorAddress to, T&& message) {
        return SendAsync(std::move(to), TEnvelope::Of(std::forward<T>(message)));
    }

    /// Answers the current envelope: to its reply-to address, else to its sender.
    TSendResult Reply(TEnvelope envelope);

    template<typename T>
        requires CMessage<std::decay_t<T>>
    TSendResult Reply(T&& message) {
        return Reply(TEnvelope::Of(std::forward<T>(message)));
    }

    TPublishReport Publish(const std::string& topic, TEnvelope envelope);

    template<typename T>
        requires CMessage<std::decay_t<T>>
    TPublishReport Publish(const std::string& topic, T&& message) {
        return Publish(topic, TEnvelope::Of(std::forward<T>(message)));
    }

    bool Subscribe(const std::string& topic);
    bool Unsubscribe(const std::string& topic);

    /// Spawns an unsupervised actor. Throws TRegistrationError.
    TActorAddress Spawn(std::unique_ptr<IActor> actor, TSpawnOptions options = {});

    /// Asks the execution loop to stop once the current handler returns.
    void Stop() {
        StopRequested_ = true;
    }

    bool StopRequested() const {
        return StopRequested_;
    }

    auto Sleep(TTime until) {
        return Poller_->Sleep(until);
    }

    template<typename Rep, typename Period>
    auto Sleep(std::chrono::duration<Rep,Period> duration) {
        return Poller_->Sleep(duration);
    }

    TActorSystem& System() {
        return *System_;
    }

    TMessageBroker& Broker();
    const TLogger& Log() const;

    TPollerBase* Poller() const {
        return Poller_;
    }

private:
    friend class TActorCell;

    void BeginMessage(const TEnvelope& envelope);
    void EndMessage();

    TActorSystem* System_;
    TPollerBase* Poller_;
    TActorAddress Self_;
    std::optional<TActorAddress> Sender_;
    std::optional<TActorAddress> ReplyTo_;
    std::optional<TCorrelationId> CorrelationId_;
    uint64_t MessagesProcessed_ = 0;
    TTime StartedAt_{};
    uint32_t RestartCount_ = 0;
    bool StopRequested_ = false;
};

/**
 * @brief Base interface for all actors.
 *
 * Only Receive() is mandatory. Lifecycle hooks default to doing nothing,
 * OnError() defaults to EErrorAction::Stop and HealthCheck() to healthy.
 */
class IActor {
public:
    using TPtr = std::unique_ptr<IActor>;

    virtual ~IActor() = default;

    /// Runs before the first message; a failure or timeout aborts the start.
    virtual TFuture<void> PreStart(TActorContext& ctx);

    virtual TFuture<void> Receive(TEnvelope envelope, TActorContext& ctx) = 0;

    /// Runs once when the actor stops, gracefully or not.
    virtual TFuture<void> PostStop(TActorContext& ctx);

    /// Called with the exception a handler threw.
    virtual EErrorAction OnError(const std::exception_ptr& error, TActorContext& ctx);

    virtual TFuture<THealth> HealthCheck(TActorContext& ctx);
};

/// Builds a fresh actor instance; used for restarts.
using TActorFactory = std::function<IActor::TPtr()>;

/**
 * @brief Actor with per-type handlers.
 * @tparam TDerived The concrete actor
 * @tparam TMessages Message types with a Receive(const T&, TActorContext&) handler
 *
 * A handler returns void or TFuture<void>. Messages of other types go to
 * TDerived::HandleUnknownMessage(), which logs them by default.
 */
template<typename TDerived, typename... TMessages>
class TBehaviorActor : public IActor {
public:
    TFuture<void> Receive(TEnvelope envelope, TActorContext& ctx) override {
        TFuture<void> pending;
        bool handled = (TryHandleMessage<TMessages>(envelope, ctx, pending) || ...);
        if (!handled) {
            static_cast<TDerived*>(this)->HandleUnknownMessage(envelope, ctx);
        }
        if (pending.valid()) {
            co_await pending;
        }
    }

    void HandleUnknownMessage(const TEnvelope& envelope, TActorContext& ctx) {
        ctx.Log().Warning() << ctx.Self() << ": unhandled message " << envelope.Message.TypeName()
            << " (" << envelope.Message.Id() << ")";
    }

private:
    template<typename TMessage>
    bool TryHandleMessage(const TEnvelope& envelope, TActorContext& ctx, TFuture<void>& pending) {
        if (!envelope.Message.Is<TMessage>()) {
            return false;
        }

        auto* self = static_cast<TDerived*>(this);
        using TReturn = decltype(self->Receive(std::declval<const TMessage&>(), ctx));
        if constexpr (std::is_same_v<TReturn, void>) {
            self->Receive(envelope.Message.As<TMessage>(), ctx);
        } else {
            pending = self->Receive(envelope.Message.As<TMessage>(), ctx);
        }
        return true;
    }
};

} // namespace NActors
} // namespace NActorRt
