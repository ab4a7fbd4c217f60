#include "envelope.hpp"

#include <atomic>

namespace NActorRt {
namespace NActors {

std::string_view ToString(EPriority priority) {
    switch (priority) {
    case EPriority::Low: return "low";
    case EPriority::Normal: return "normal";
    case EPriority::High: return "high";
    case EPriority::Critical: return "critical";
    }
    return "unknown";
}

TCorrelationId NewCorrelationId() {
    static std::atomic<TCorrelationId> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
}

TEnvelope::TEnvelope(TMessage message)
    : Message(std::move(message))
    , Timestamp(TClock::now())
    , Priority(Message.Priority())
{ }

TEnvelope TEnvelope::WithSender(TActorAddress sender) && {
    Sender = std::move(sender);
    return std::move(*this);
}

TEnvelope TEnvelope::WithReplyTo(TActorAddress replyTo) && {
    ReplyTo = std::move(replyTo);
    return std::move(*this);
}

TEnvelope TEnvelope::WithCorrelationId(TCorrelationId id) && {
    CorrelationId = id;
    return std::move(*this);
}

TEnvelope TEnvelope::WithPriority(EPriority priority) && {
    Priority = priority;
    return std::move(*this);
}

TEnvelope TEnvelope::WithTtl(std::chrono::milliseconds ttl) && {
    Ttl = ttl;
    return std::move(*this);
}

TEnvelope TEnvelope::Clone() const {
    TEnvelope copy(Message.Clone());
    copy.Sender = Sender;
    copy.ReplyTo = ReplyTo;
    copy.Timestamp = Timestamp;
    copy.CorrelationId = CorrelationId;
    copy.Priority = Priority;
    copy.Ttl = Ttl;
    return copy;
}

bool TEnvelope::IsExpired(TTime now) const {
    return Ttl && Age(now) > *Ttl;
}

} // namespace NActors
} // namespace NActorRt
