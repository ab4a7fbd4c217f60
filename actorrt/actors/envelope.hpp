#pragma once

#include <chrono>
#include <optional>

#include <actorrt/base.hpp>

#include "address.hpp"
#include "message.hpp"

namespace NActorRt {
namespace NActors {

/// Request/response pairing identifier
using TCorrelationId = uint64_t;

/// Process-unique correlation id, never 0.
TCorrelationId NewCorrelationId();

/**
 * @brief Message plus delivery metadata.
 *
 * An envelope is owned by the mailbox until the execution loop dequeues it.
 * The builder methods work on temporaries:
 * @code
 * auto envelope = TEnvelope::Of(TPing{})
 *     .WithSender(self)
 *     .WithTtl(std::chrono::milliseconds(50));
 * @endcode
 */
class TEnvelope {
public:
    TEnvelope() = default;
    explicit TEnvelope(TMessage message);

    template<typename T>
    static TEnvelope Of(T&& message) {
        return TEnvelope(TMessage::Make(std::forward<T>(message)));
    }

    TEnvelope(TEnvelope&&) = default;
    TEnvelope& operator=(TEnvelope&&) = default;

    TEnvelope WithSender(TActorAddress sender) &&;
    TEnvelope WithReplyTo(TActorAddress replyTo) &&;
    TEnvelope WithCorrelationId(TCorrelationId id) &&;
    TEnvelope WithPriority(EPriority priority) &&;
    TEnvelope WithTtl(std::chrono::milliseconds ttl) &&;

    /// Deep copy, same metadata and timestamp.
    TEnvelope Clone() const;

    TClock::duration Age(TTime now) const {
        return now - Timestamp;
    }

    /// True when a TTL is set and strictly less than the envelope's age.
    bool IsExpired(TTime now) const;

    TMessage Message;
    std::optional<TActorAddress> Sender;
    std::optional<TActorAddress> ReplyTo;
    TTime Timestamp = TClock::now();
    std::optional<TCorrelationId> CorrelationId;
    EPriority Priority = EPriority::Normal;
    std::optional<std::chrono::milliseconds> Ttl;
};

} // namespace NActors
} // namespace NActorRt
