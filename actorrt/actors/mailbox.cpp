#include "mailbox.hpp"

#include <algorithm>

namespace NActorRt {
namespace NActors {

std::string_view ToString(EBackpressure policy) {
    switch (policy) {
    case EBackpressure::Block: return "block";
    case EBackpressure::Drop: return "drop";
    case EBackpressure::Reject: return "reject";
    }
    return "unknown";
}

EBackpressure BackpressureForPriority(EPriority priority) {
    switch (priority) {
    case EPriority::Critical:
    case EPriority::High:
        return EBackpressure::Block;
    case EPriority::Normal:
        return EBackpressure::Reject;
    case EPriority::Low:
        return EBackpressure::Drop;
    }
    return EBackpressure::Reject;
}

TMailbox::TMailbox(TPollerBase* poller, TActorAddress owner, TMailboxConfig config)
    : Owner_(std::move(owner))
    , Config_(config)
    , Queue_(Config_.IsBounded() ? std::min<size_t>(Config_.Capacity + 1, 1024) : 16)
    , NotEmpty_(poller)
    , NotFull_(poller)
{ }

TSendResult TMailbox::TryEnqueue(TEnvelope&& envelope) {
    if (Closed_) {
        Metrics_.Rejected++;
        return std::unexpected(TSendError{ESendError::MailboxClosed, Owner_});
    }

    if (Full()) {
        switch (Config_.Backpressure) {
        case EBackpressure::Drop: {
            auto dropped = std::move(envelope);
            Metrics_.Dropped++;
            return {};
        }
        case EBackpressure::Reject:
            Metrics_.Rejected++;
            return std::unexpected(TSendError{ESendError::MailboxFull, Owner_, Config_.Capacity});
        case EBackpressure::Block:
            return std::unexpected(TSendError{ESendError::WouldBlock, Owner_, Config_.Capacity});
        }
    }

    Queue_.Push(std::move(envelope));
    Metrics_.Sent++;
    Metrics_.LastMessage = TClock::now();
    NotEmpty_.NotifyOne();
    return {};
}

TFuture<TSendResult> TMailbox::Enqueue(TEnvelope envelope) {
    while (true) {
        auto result = TryEnqueue(std::move(envelope));
        if (result || result.error().Code != ESendError::WouldBlock) {
            co_return result;
        }
        co_await NotFull_.Wait();
    }
}

std::optional<TEnvelope> TMailbox::TryDequeue() {
    TEnvelope envelope;
    while (Queue_.TryPop(envelope)) {
        NotFull_.NotifyOne();
        if (envelope.IsExpired(TClock::now())) {
            Metrics_.Expired++;
            if (OnExpired_) {
                OnExpired_(envelope);
            }
            continue;
        }
        Metrics_.Received++;
        return std::optional<TEnvelope>(std::move(envelope));
    }
    return std::nullopt;
}

TFuture<std::optional<TEnvelope>> TMailbox::Dequeue() {
    while (true) {
        if (auto envelope = TryDequeue()) {
            co_return std::move(envelope);
        }
        if (Closed_) {
            co_return std::nullopt;
        }
        co_await NotEmpty_.Wait();
    }
}

void TMailbox::Close() {
    if (Closed_) {
        return;
    }
    Closed_ = true;
    NotEmpty_.NotifyAll();
    NotFull_.NotifyAll();
}

size_t TMailbox::Discard() {
    auto count = Queue_.Size();
    Queue_.Clear();
    Metrics_.Dropped += count;
    NotFull_.NotifyAll();
    return count;
}

} // namespace NActors
} // namespace NActorRt
