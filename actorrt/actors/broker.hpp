#pragma once

#include <memory>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <actorrt/corochain.hpp>

#include "address.hpp"
#include "envelope.hpp"
#include "errors.hpp"
#include "mailbox.hpp"

namespace NActorRt {
namespace NActors {

enum class EPoolStrategy {
    RoundRobin,
    Random
};

/// Outcome of a publish: one entry per subscriber in the snapshot.
struct TPublishReport {
    size_t Delivered = 0;
    std::vector<TSendError> Failures;

    size_t Attempted() const {
        return Delivered + Failures.size();
    }
};

/**
 * @brief Directory of mailboxes: point-to-point send, topics and pools.
 *
 * The address table, topic table and pools are guarded by a shared mutex,
 * so registration and lookup may come from any thread. The mailboxes
 * themselves belong to the loop that runs the actor system: Send/Publish
 * must be called from that loop.
 *
 * Mailboxes are held by shared_ptr, so a sender that looked up a mailbox
 * keeps it alive even if the actor is unregistered concurrently; such a
 * send fails with ESendError::MailboxClosed.
 *
 * Actors named "pool:member" are members of pool "pool".
 */
class TMessageBroker {
public:
    explicit TMessageBroker(TPollerBase* poller);

    TMessageBroker(const TMessageBroker&) = delete;
    TMessageBroker& operator=(const TMessageBroker&) = delete;

    /// Creates the mailbox of @p address. Throws TRegistrationError if the address or its name is taken.
    std::shared_ptr<TMailbox> Register(const TActorAddress& address, TMailboxConfig config = {});

    /// Releases the address, its name, its subscriptions and pool membership.
    bool Unregister(const TActorAddress& address);

    bool IsRegistered(const TActorAddress& address) const;
    std::optional<TActorAddress> Resolve(std::string_view name) const;
    std::shared_ptr<TMailbox> Lookup(const TActorAddress& address) const;
    size_t ActorCount() const;

    /// Never suspends; ESendError::AddressNotFound for unknown addresses.
    TSendResult Send(const TActorAddress& to, TEnvelope envelope);

    /// Like Send(), but waits for room in a full mailbox with EBackpressure::Block.
    TFuture<TSendResult> SendAsync(TActorAddress to, TEnvelope envelope);

    /// Delivers a clone of @p envelope to every subscriber registered right now.
    TPublishReport Publish(const std::string& topic, const TEnvelope& envelope);

    /// False if the address is unknown or already subscribed.
    bool Subscribe(const TActorAddress& address, const std::string& topic);
    bool Unsubscribe(const TActorAddress& address, const std::string& topic);
    std::vector<TActorAddress> Subscribers(const std::string& topic) const;

    std::optional<TActorAddress> SelectFromPool(const std::string& pool, EPoolStrategy strategy = EPoolStrategy::RoundRobin);
    std::vector<TActorAddress> PoolMembers(const std::string& pool) const;

    TPollerBase* Poller() const {
        return Poller_;
    }

private:
    struct TPool {
        std::vector<TActorAddress> Members;
        size_t Next = 0;
    };

    static std::optional<std::string> PoolOf(const TActorAddress& address);

    TPollerBase* Poller_;
    mutable std::shared_mutex Mutex_;
    std::unordered_map<TActorAddress, std::shared_ptr<TMailbox>> Mailboxes_;
    std::unordered_map<std::string, TActorAddress> Names_;
    std::unordered_map<std::string, std::vector<TActorAddress>> Topics_;
    std::unordered_map<std::string, TPool> Pools_;
    std::minstd_rand Random_{std::random_device{}()};
};

} // namespace NActors
} // namespace NActorRt
