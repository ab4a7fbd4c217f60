#include "actor.hpp"
#include "actorsystem.hpp"

namespace NActorRt {
namespace NActors {

std::string_view ToString(EErrorAction action) {
    switch (action) {
    case EErrorAction::Resume: return "resume";
    case EErrorAction::Stop: return "stop";
    case EErrorAction::Restart: return "restart";
    case EErrorAction::Escalate: return "escalate";
    }
    return "unknown";
}

std::string_view ToString(EHealthStatus status) {
    switch (status) {
    case EHealthStatus::Healthy: return "healthy";
    case EHealthStatus::Degraded: return "degraded";
    case EHealthStatus::Failed: return "failed";
    }
    return "unknown";
}

TFuture<void> IActor::PreStart(TActorContext&) {
    co_return;
}

TFuture<void> IActor::PostStop(TActorContext&) {
    co_return;
}

EErrorAction IActor::OnError(const std::exception_ptr&, TActorContext&) {
    return EErrorAction::Stop;
}

TFuture<THealth> IActor::HealthCheck(TActorContext&) {
    co_return THealth::Healthy();
}

TActorContext::TActorContext(TActorSystem* system, TActorAddress self)
    : System_(system)
    , Poller_(system->Poller())
    , Self_(std::move(self))
{ }

void TActorContext::BeginMessage(const TEnvelope& envelope) {
    Sender_ = envelope.Sender;
    ReplyTo_ = envelope.ReplyTo;
    CorrelationId_ = envelope.CorrelationId;
}

void TActorContext::EndMessage() {
    MessagesProcessed_++;
    Sender_.reset();
    ReplyTo_.reset();
    CorrelationId_.reset();
}

TSendResult TActorContext::Send(const TActorAddress& to, TEnvelope envelope) {
    if (!envelope.Sender) {
        envelope.Sender = Self_;
    }
    return System_->Broker().Send(to, std::move(envelope));
}

TFuture<TSendResult> TActorContext::SendAsync(TActorAddress to, TEnvelope envelope) {
    if (!envelope.Sender) {
        envelope.Sender = Self_;
    }
    return System_->Broker().SendAsync(std::move(to), std::move(envelope));
}

TSendResult TActorContext::Reply(TEnvelope envelope) {
    auto target = ReplyTo_ ? ReplyTo_ : Sender_;
    if (!target) {
        return std::unexpected(TSendError{ESendError::AddressNotFound, TActorAddress{}});
    }
    if (!envelope.CorrelationId) {
        envelope.CorrelationId = CorrelationId_;
    }
    return Send(*target, std::move(envelope));
}

TPublishReport TActorContext::Publish(const std::string& topic, TEnvelope envelope) {
    if (!envelope.Sender) {
        envelope.Sender = Self_;
    }
    return System_->Broker().Publish(topic, envelope);
}

bool TActorContext::Subscribe(const std::string& topic) {
    return System_->Broker().Subscribe(Self_, topic);
}

bool TActorContext::Unsubscribe(const std::string& topic) {
    return System_->Broker().Unsubscribe(Self_, topic);
}

TActorAddress TActorContext::Spawn(std::unique_ptr<IActor> actor, TSpawnOptions options) {
    return System_->Spawn(std::move(actor), std::move(options));
}

TMessageBroker& TActorContext::Broker() {
    return System_->Broker();
}

const TLogger& TActorContext::Log() const {
    return System_->Log();
}

} // namespace NActors
} // namespace NActorRt
