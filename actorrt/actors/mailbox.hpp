#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include <actorrt/corochain.hpp>
#include <actorrt/sync.hpp>

#include "envelope.hpp"
#include "errors.hpp"
#include "queue.hpp"

namespace NActorRt {
namespace NActors {

/// What a bounded mailbox does with a new envelope when it is full.
enum class EBackpressure {
    Block,  // sender suspends until a slot frees
    Drop,   // new envelope is discarded, sender sees success
    Reject  // sender gets ESendError::MailboxFull
};

std::string_view ToString(EBackpressure policy);

/// Critical and High block, Normal rejects, Low drops.
EBackpressure BackpressureForPriority(EPriority priority);

struct TMailboxConfig {
    static constexpr size_t Unbounded = 0;

    size_t Capacity = Unbounded;
    EBackpressure Backpressure = EBackpressure::Reject;

    bool IsBounded() const {
        return Capacity != Unbounded;
    }
};

struct TMailboxMetrics {
    uint64_t Sent = 0;      ///< accepted into the queue
    uint64_t Received = 0;  ///< handed to the consumer
    uint64_t Dropped = 0;   ///< discarded by Drop policy or on close
    uint64_t Rejected = 0;  ///< refused because full or closed
    uint64_t Expired = 0;   ///< discarded at dequeue because the TTL elapsed
    TTime LastMessage{};

    uint64_t InFlight() const {
        return Sent - Received - Expired;
    }
};

/**
 * @brief Per-actor FIFO queue of envelopes.
 *
 * Envelopes are delivered in the order they were accepted, which gives FIFO
 * per sender. A bounded mailbox enforces its capacity at enqueue time through
 * its backpressure policy.
 *
 * Suspension points: @ref Dequeue() when empty, @ref Enqueue() when full under
 * EBackpressure::Block. Waiters are resumed through the poller, never from the
 * stack of the sender or receiver that freed them.
 *
 * Expired envelopes are counted and skipped by both dequeue forms; they are
 * never handed to the consumer.
 */
class TMailbox {
public:
    using TExpiredCallback = std::function<void(const TEnvelope&)>;

    TMailbox(TPollerBase* poller, TActorAddress owner, TMailboxConfig config = {});

    TMailbox(const TMailbox&) = delete;
    TMailbox& operator=(const TMailbox&) = delete;

    /**
     * @brief Enqueues without suspending.
     *
     * @p envelope is moved from only when it is accepted or dropped by policy;
     * on error the caller still owns it. With EBackpressure::Block and a full
     * mailbox the result is ESendError::WouldBlock.
     */
    TSendResult TryEnqueue(TEnvelope&& envelope);

    /// Enqueues, suspending while full under EBackpressure::Block.
    TFuture<TSendResult> Enqueue(TEnvelope envelope);

    std::optional<TEnvelope> TryDequeue();

    /// Next live envelope; suspends while empty. Empty result once closed and drained.
    TFuture<std::optional<TEnvelope>> Dequeue();

    /// Refuses further envelopes and wakes every waiter. Queued envelopes stay.
    void Close();

    /// Drops every queued envelope; returns how many were dropped.
    size_t Discard();

    void SetExpiredCallback(TExpiredCallback callback) {
        OnExpired_ = std::move(callback);
    }

    size_t Size() const {
        return Queue_.Size();
    }

    bool Empty() const {
        return Queue_.Empty();
    }

    bool Full() const {
        return Config_.IsBounded() && Queue_.Size() >= Config_.Capacity;
    }

    bool IsClosed() const {
        return Closed_;
    }

    size_t Capacity() const {
        return Config_.Capacity;
    }

    const TMailboxConfig& Config() const {
        return Config_;
    }

    const TMailboxMetrics& Metrics() const {
        return Metrics_;
    }

    const TActorAddress& Owner() const {
        return Owner_;
    }

private:
    TActorAddress Owner_;
    TMailboxConfig Config_;
    TUnboundedVectorQueue<TEnvelope> Queue_;
    TWaitList NotEmpty_;
    TWaitList NotFull_;
    TMailboxMetrics Metrics_;
    TExpiredCallback OnExpired_;
    bool Closed_ = false;
};

} // namespace NActors
} // namespace NActorRt
