#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <actorrt/corochain.hpp>
#include <actorrt/sync.hpp>
#include <actorrt/actors/monitor.hpp>
#include <actorrt/actors/queue.hpp>

#include "backoff.hpp"
#include "child.hpp"
#include "health_monitor.hpp"
#include "policy.hpp"

/**
 * @file supervisor.hpp
 * @brief Supervision tree node.
 *
 * A supervisor owns an ordered list of children. When a child exits on its
 * own, the supervisor consults the child's restart policy, selects the
 * children to restart with its strategy, charges the restart to its budget
 * and restarts them. An exhausted budget fails the supervisor: its children
 * are stopped and the failure goes to its parent, which treats it like any
 * other failed child (the root reports it to the actor system as fatal).
 *
 * @code
 * TSupervisorConfig config;
 * config.Strategy = ERestartStrategy::RestForOne;
 * config.Budget.MaxRestarts = 3;
 *
 * auto& root = system.CreateSupervisor("app", config);
 * co_await root.StartChild(TChildSpec::Actor<TDatabase>("db"));
 * co_await root.StartChild(TChildSpec::Actor<TCache>("cache"));
 * co_await root.StartChild(TChildSpec::Actor<TApi>("api"));
 * @endcode
 *
 * Child exits are queued and handled one at a time by the supervisor's own
 * task; every change to the child list (exit handling, health restarts,
 * StartChild/StopChild/RestartChild) takes the same async mutex.
 */

namespace NActorRt {
namespace NActors {

struct TSupervisorConfig {
    ERestartStrategy Strategy = ERestartStrategy::OneForOne;
    TRestartBudget Budget;
    THealthConfig Health;

    void Validate() const;
};

enum class ESupervisorState {
    Created,
    Running,
    Stopping,
    Stopped,
    Failed
};

std::string_view ToString(ESupervisorState state);

class TSupervisor : public IChild {
public:
    /**
     * @param system   Owner of the broker and monitor
     * @param name     Prefix of the children's addresses: "name/child"
     * @param children Started in order by Start()
     */
    TSupervisor(TActorSystem* system, std::string name, TSupervisorConfig config = {},
                std::vector<TChildSpec> children = {});
    ~TSupervisor();

    TSupervisor(const TSupervisor&) = delete;
    TSupervisor& operator=(const TSupervisor&) = delete;

    /// Starts the supervisor's tasks, then the initial children in order. Throws TStartError.
    TFuture<void> Start() override;

    /// Stops the children in reverse registration order. Never throws.
    TFuture<void> Stop(TShutdownPolicy policy) override;

    /// Failed unless running; Degraded while some child is not running.
    TFuture<THealth> HealthCheck() override;

    bool Running() const override {
        return State_ == ESupervisorState::Running;
    }

    bool Finished() const override {
        return State_ == ESupervisorState::Stopped || State_ == ESupervisorState::Failed;
    }

    /**
     * @brief Registers and starts a child.
     *
     * Throws TStartError if the child fails to start (it is not kept),
     * std::invalid_argument for an invalid spec or a duplicate id and
     * TSupervisionError when the supervisor is not running.
     */
    TFuture<TChildId> StartChild(TChildSpec spec);

    /**
     * @brief Stops the child with its shutdown policy and forgets it. False for unknown ids.
     *
     * The work runs on a task owned by the supervisor, so a child may stop
     * itself; its own call is then cancelled with its handler.
     */
    TFuture<bool> StopChild(TChildId id);

    /// Stops and starts the child again; not charged to the restart budget. Throws TStartError.
    TFuture<bool> RestartChild(TChildId id);

    /// Probes the child now; empty for unknown ids.
    TFuture<std::optional<THealth>> CheckChildHealth(TChildId id);

    std::vector<TChildId> ChildIds() const;
    std::optional<TChildId> FindChild(std::string_view id) const;
    std::optional<EChildState> ChildState(TChildId id) const;
    std::optional<TActorAddress> ChildAddress(TChildId id) const;
    /// The running instance; nullptr while the child is restarting or stopped.
    IChild* ChildInstance(TChildId id) const;
    uint32_t ChildRestartCount(TChildId id) const;

    size_t ChildCount() const {
        return Children_.size();
    }

    const std::string& Name() const {
        return Name_;
    }

    ESupervisorState State() const {
        return State_;
    }

    const TSupervisorConfig& Config() const {
        return Config_;
    }

    TRestartBackoff& Backoff() {
        return Backoff_;
    }

    const THealthMonitor& Health() const {
        return Health_;
    }

private:
    friend class IChild;
    friend class TActorSystem;

    struct TChildSlot {
        TChildId Id = 0;
        TChildSpec Spec;
        TActorAddress Address;
        IChild::TPtr Instance;
        EChildState State = EChildState::Stopped;
        uint64_t Generation = 0;
        uint32_t RestartCount = 0;
    };

    struct TJobState {
        bool Done = false;
        bool Result = false;
        std::exception_ptr Error;
    };

    struct TExitSignal {
        TChildId Id = 0;
        uint64_t Generation = 0;
        TActorExit Exit;
    };

    void OnChildExit(TChildId id, uint64_t generation, TActorExit exit);

    TFuture<bool> AwaitJob(TFuture<bool> work);
    TFuture<void> RunJob(std::shared_ptr<TJobState> state, TFuture<bool> work);
    TFuture<bool> DoStopChild(TChildId id);
    TFuture<bool> DoRestartChild(TChildId id);

    TFuture<void> Run();
    TFuture<void> RunHealthChecks();
    TFuture<void> ProbeChildren();
    TFuture<void> HandleExit(TExitSignal signal);
    TFuture<void> RestartChildren(std::vector<TChildId> targets, TChildId failed);
    TFuture<bool> StartSlot(TChildId id);
    TFuture<void> StopSlot(TChildId id, std::optional<TShutdownPolicy> policy = std::nullopt);
    TFuture<void> StopAll(std::optional<TShutdownPolicy> policy);
    TFuture<void> Fail(std::string reason);

    void Activate();
    TChildId AddSlot(TChildSpec spec);
    void RemoveSlot(TChildId id);
    TChildSlot* FindSlot(TChildId id);
    const TChildSlot* FindSlot(TChildId id) const;
    std::vector<TChildId> SelectTargets(TChildId failed) const;
    void Report(EEventKind kind, const TChildSlot* slot, std::string detail = {});

    TActorSystem* System_;
    std::string Name_;
    TSupervisorConfig Config_;
    std::vector<TChildSpec> InitialChildren_;
    ESupervisorState State_ = ESupervisorState::Created;
    std::vector<TChildSlot> Children_;
    TChildId NextChildId_ = 1;
    TRestartBackoff Backoff_;
    THealthMonitor Health_;
    std::exception_ptr LastStartError_;
    // root of SpawnSupervised(): handed back to the system once empty or failed
    bool Disposable_ = false;
    TUnboundedVectorQueue<TExitSignal> Signals_;
    TWaitList SignalsReady_;
    TWaitList StateChanged_;
    TAsyncMutex Mutex_;
    TWaitList JobsDone_;
    std::vector<TFuture<void>> Jobs_;
    TFuture<void> HealthTask_;
    TFuture<void> Task_;
};

} // namespace NActors
} // namespace NActorRt
