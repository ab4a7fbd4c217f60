#include "broker.hpp"

#include <algorithm>
#include <mutex>

namespace NActorRt {
namespace NActors {

TMessageBroker::TMessageBroker(TPollerBase* poller)
    : Poller_(poller)
{ }

std::optional<std::string> TMessageBroker::PoolOf(const TActorAddress& address) {
    const auto& name = address.Name();
    auto pos = name.find(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 == name.size()) {
        return std::nullopt;
    }
    return name.substr(0, pos);
}

std::shared_ptr<TMailbox> TMessageBroker::Register(const TActorAddress& address, TMailboxConfig config) {
    if (!address) {
        throw TRegistrationError("cannot register an empty address");
    }

    std::unique_lock lock(Mutex_);
    if (Mailboxes_.contains(address)) {
        throw TRegistrationError("address already registered: " + address.ToString());
    }
    if (address.IsNamed() && Names_.contains(address.Name())) {
        throw TRegistrationError("name already registered: " + address.Name());
    }

    auto mailbox = std::make_shared<TMailbox>(Poller_, address, config);
    Mailboxes_.emplace(address, mailbox);
    if (address.IsNamed()) {
        Names_.emplace(address.Name(), address);
    }
    if (auto pool = PoolOf(address)) {
        Pools_[*pool].Members.push_back(address);
    }
    return mailbox;
}

bool TMessageBroker::Unregister(const TActorAddress& address) {
    std::unique_lock lock(Mutex_);
    auto it = Mailboxes_.find(address);
    if (it == Mailboxes_.end()) {
        return false;
    }
    it->second->Close();
    Mailboxes_.erase(it);

    if (address.IsNamed()) {
        Names_.erase(address.Name());
    }

    for (auto topic = Topics_.begin(); topic != Topics_.end(); ) {
        std::erase(topic->second, address);
        if (topic->second.empty()) {
            topic = Topics_.erase(topic);
        } else {
            ++topic;
        }
    }

    if (auto pool = PoolOf(address)) {
        auto poolIt = Pools_.find(*pool);
        if (poolIt != Pools_.end()) {
            std::erase(poolIt->second.Members, address);
            if (poolIt->second.Members.empty()) {
                Pools_.erase(poolIt);
            }
        }
    }
    return true;
}

bool TMessageBroker::IsRegistered(const TActorAddress& address) const {
    std::shared_lock lock(Mutex_);
    return Mailboxes_.contains(address);
}

std::optional<TActorAddress> TMessageBroker::Resolve(std::string_view name) const {
    std::shared_lock lock(Mutex_);
    auto it = Names_.find(std::string(name));
    if (it == Names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<TMailbox> TMessageBroker::Lookup(const TActorAddress& address) const {
    std::shared_lock lock(Mutex_);
    auto it = Mailboxes_.find(address);
    return it == Mailboxes_.end() ? nullptr : it->second;
}

size_t TMessageBroker::ActorCount() const {
    std::shared_lock lock(Mutex_);
    return Mailboxes_.size();
}

TSendResult TMessageBroker::Send(const TActorAddress& to, TEnvelope envelope) {
    auto mailbox = Lookup(to);
    if (!mailbox) {
        return std::unexpected(TSendError{ESendError::AddressNotFound, to});
    }
    return mailbox->TryEnqueue(std::move(envelope));
}

TFuture<TSendResult> TMessageBroker::SendAsync(TActorAddress to, TEnvelope envelope) {
    auto mailbox = Lookup(to);
    if (!mailbox) {
        co_return std::unexpected(TSendError{ESendError::AddressNotFound, to});
    }
    co_return co_await mailbox->Enqueue(std::move(envelope));
}

TPublishReport TMessageBroker::Publish(const std::string& topic, const TEnvelope& envelope) {
    std::vector<std::shared_ptr<TMailbox>> snapshot;
    {
        std::shared_lock lock(Mutex_);
        auto it = Topics_.find(topic);
        if (it != Topics_.end()) {
            snapshot.reserve(it->second.size());
            for (const auto& address : it->second) {
                auto mailbox = Mailboxes_.find(address);
                if (mailbox != Mailboxes_.end()) {
                    snapshot.push_back(mailbox->second);
                }
            }
        }
    }

    TPublishReport report;
    for (auto& mailbox : snapshot) {
        auto result = mailbox->TryEnqueue(envelope.Clone());
        if (result) {
            report.Delivered++;
        } else {
            report.Failures.push_back(std::move(result.error()));
        }
    }
    return report;
}

bool TMessageBroker::Subscribe(const TActorAddress& address, const std::string& topic) {
    std::unique_lock lock(Mutex_);
    if (!Mailboxes_.contains(address)) {
        return false;
    }
    auto& subscribers = Topics_[topic];
    if (std::find(subscribers.begin(), subscribers.end(), address) != subscribers.end()) {
        return false;
    }
    subscribers.push_back(address);
    return true;
}

bool TMessageBroker::Unsubscribe(const TActorAddress& address, const std::string& topic) {
    std::unique_lock lock(Mutex_);
    auto it = Topics_.find(topic);
    if (it == Topics_.end()) {
        return false;
    }
    auto removed = std::erase(it->second, address) > 0;
    if (it->second.empty()) {
        Topics_.erase(it);
    }
    return removed;
}

std::vector<TActorAddress> TMessageBroker::Subscribers(const std::string& topic) const {
    std::shared_lock lock(Mutex_);
    auto it = Topics_.find(topic);
    return it == Topics_.end() ? std::vector<TActorAddress>{} : it->second;
}

std::optional<TActorAddress> TMessageBroker::SelectFromPool(const std::string& pool, EPoolStrategy strategy) {
    std::unique_lock lock(Mutex_);
    auto it = Pools_.find(pool);
    if (it == Pools_.end() || it->second.Members.empty()) {
        return std::nullopt;
    }
    auto& members = it->second.Members;
    size_t index = 0;
    switch (strategy) {
    case EPoolStrategy::RoundRobin:
        index = it->second.Next++ % members.size();
        break;
    case EPoolStrategy::Random:
        index = std::uniform_int_distribution<size_t>(0, members.size() - 1)(Random_);
        break;
    }
    return members[index];
}

std::vector<TActorAddress> TMessageBroker::PoolMembers(const std::string& pool) const {
    std::shared_lock lock(Mutex_);
    auto it = Pools_.find(pool);
    return it == Pools_.end() ? std::vector<TActorAddress>{} : it->second.Members;
}

} // namespace NActors
} // namespace NActorRt
