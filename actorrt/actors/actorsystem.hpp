#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <actorrt/corochain.hpp>
#include <actorrt/log.hpp>
#include <actorrt/sync.hpp>
#include <actorrt/supervisor/supervisor.hpp>

#include "actor.hpp"
#include "broker.hpp"
#include "cell.hpp"
#include "monitor.hpp"

/**
 * @file actorsystem.hpp
 * @brief Entry point of the runtime: spawning, messaging, supervision roots and shutdown.
 *
 * @code
 * TLoop<TDefaultPoller> loop;
 * TActorSystem system(&loop.Poller(), {.DefaultMailbox = {.Capacity = 64}});
 *
 * auto counter = system.Spawn<TCounter>();
 * system.Send(counter, TIncrement{5});
 *
 * auto shutdown = [](TActorSystem* system, bool* done) -> TFuture<void> {
 *     co_await system->Shutdown();
 *     *done = true;
 * };
 * bool done = false;
 * auto h = shutdown(&system, &done);
 * while (!done) {
 *     loop.Step();
 * }
 * @endcode
 */

namespace NActorRt {
namespace NActors {

struct TActorSystemConfig {
    TMailboxConfig DefaultMailbox = {.Capacity = 1000, .Backpressure = EBackpressure::Reject};
    std::chrono::milliseconds StartTimeout = std::chrono::seconds(5);
    std::chrono::milliseconds ShutdownTimeout = std::chrono::seconds(30);
    /// Limit for Spawn(); 0 is unlimited.
    size_t MaxActors = 0;
    ELogLevel LogLevel = ELogLevel::Info;
    TLogger::TSink LogSink;
    /// TInMemoryMonitor when unset.
    std::shared_ptr<IMonitor> Monitor;
    /// Called when a root supervisor gives up.
    std::function<void(const std::exception_ptr&)> OnFatalError;

    /// Throws std::invalid_argument.
    void Validate() const;
};

class TActorSystem : private ICellObserver {
public:
    explicit TActorSystem(TPollerBase* poller, TActorSystemConfig config = {});
    ~TActorSystem();

    TActorSystem(const TActorSystem&) = delete;
    TActorSystem& operator=(const TActorSystem&) = delete;

    /**
     * @brief Registers an unsupervised actor and starts it in the background.
     *
     * Throws TRegistrationError when the name is taken, the actor limit is
     * reached or the system is shutting down. A pre-start failure is logged
     * and reported as an event; the address is released.
     */
    TActorAddress Spawn(IActor::TPtr actor, TSpawnOptions options = {});

    /// Like Spawn(actor), and @p factory builds the instance of every in-place restart.
    TActorAddress Spawn(TActorFactory factory, TSpawnOptions options = {});

    template<typename T, typename... TArgs>
    TActorAddress Spawn(TArgs&&... args) {
        return Spawn(IActor::TPtr(std::make_unique<T>(std::forward<TArgs>(args)...)));
    }

    /**
     * @brief Starts @p spec under a new root supervisor; throws TStartError if it does not start.
     *
     * The supervisor is disposed of once its child is gone for good or it
     * gives up.
     */
    TFuture<TActorAddress> SpawnSupervised(TChildSpec spec, TSupervisorConfig config = {});

    /// New running root supervisor without children; owned by the system. Throws TRegistrationError for a taken name.
    TSupervisor& CreateSupervisor(std::string name, TSupervisorConfig config = {});

    size_t SupervisorsSize() const {
        return Supervisors_.size();
    }

    TSendResult Send(const TActorAddress& to, TEnvelope envelope) {
        return Broker_.Send(to, std::move(envelope));
    }

    template<typename T>
        requires CMessage<std::decay_t<T>>
    TSendResult Send(const TActorAddress& to, T&& message) {
        return Send(to, TEnvelope::Of(std::forward<T>(message)));
    }

    TFuture<TSendResult> SendAsync(TActorAddress to, TEnvelope envelope) {
        return Broker_.SendAsync(std::move(to), std::move(envelope));
    }

    template<typename T>
        requires CMessage<std::decay_t<T>>
    TFuture<TSendResult> SendAsync(TActorAddress to, T&& message) {
        return SendAsync(std::move(to), TEnvelope::Of(std::forward<T>(message)));
    }

    TPublishReport Publish(const std::string& topic, const TEnvelope& envelope) {
        return Broker_.Publish(topic, envelope);
    }

    template<typename T>
        requires CMessage<std::decay_t<T>>
    TPublishReport Publish(const std::string& topic, T&& message) {
        return Publish(topic, TEnvelope::Of(std::forward<T>(message)));
    }

    /// Gracefully stops an unsupervised actor; supervised ones are stopped through their supervisor.
    TFuture<void> Stop(TActorAddress address);

    /// Stops the root supervisors (last created first), then every unsupervised actor.
    TFuture<void> Shutdown();

    /// Registered actors, supervised ones included.
    size_t ActorsSize() const {
        return Broker_.ActorCount();
    }

    bool IsShuttingDown() const {
        return ShuttingDown_;
    }

    /// First root supervisor failure, if any.
    std::exception_ptr FatalError() const {
        return FatalError_;
    }

    /// Cell of an unsupervised actor, nullptr once it is gone.
    TActorCell* Cell(const TActorAddress& address) const;

    TMessageBroker& Broker() {
        return Broker_;
    }

    IMonitor& Monitor() {
        return *Monitor_;
    }

    const TLogger& Log() const {
        return Log_;
    }

    TPollerBase* Poller() const {
        return Poller_;
    }

    const TActorSystemConfig& Config() const {
        return Config_;
    }

    void Report(const TRuntimeEvent& event) {
        Monitor_->Record(event);
    }

private:
    friend class TSupervisor;

    void OnActorExit(TActorCell& cell, const TActorExit& exit) override;
    void OnActorStopped(TActorCell& cell) override;
    void OnRootFailure(TSupervisor& supervisor, const std::exception_ptr& error);

    TActorAddress SpawnCell(IActor::TPtr actor, TActorFactory factory, TSpawnOptions options);
    void Retire(const TActorAddress& address);
    void Dispose(TSupervisor& supervisor);
    TSupervisor* FindSupervisor(const std::string& name) const;
    TFuture<void> Reap();

    TPollerBase* Poller_;
    TActorSystemConfig Config_;
    TLogger Log_;
    std::shared_ptr<IMonitor> Monitor_;
    TMessageBroker Broker_;
    std::unordered_map<TActorAddress, std::unique_ptr<TActorCell>> Actors_;
    std::vector<std::unique_ptr<TSupervisor>> Supervisors_;
    std::vector<std::unique_ptr<TActorCell>> Dead_;
    std::vector<std::unique_ptr<TSupervisor>> DeadSupervisors_;
    TWaitList DeadReady_;
    std::exception_ptr FatalError_;
    uint64_t NextSupervisorId_ = 0;
    bool ShuttingDown_ = false;
    TFuture<void> Reaper_;
};

} // namespace NActors
} // namespace NActorRt
