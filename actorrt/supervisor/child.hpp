#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <actorrt/corochain.hpp>
#include <actorrt/actors/actor.hpp>
#include <actorrt/actors/cell.hpp>

#include "policy.hpp"

namespace NActorRt {
namespace NActors {

class TActorSystem;
class TSupervisor;
struct TSupervisorConfig;
struct TChildSpec;

/// Identifier of a child within its supervisor, assigned at registration.
using TChildId = uint32_t;

/**
 * @brief A unit a supervisor can start, stop and probe: an actor or a nested supervisor.
 *
 * An instance is started at most once. Restarting a child means stopping the
 * instance and starting a new one built by the spec's factory.
 */
class IChild {
public:
    using TPtr = std::unique_ptr<IChild>;

    virtual ~IChild() = default;

    /// Throws TStartError.
    virtual TFuture<void> Start() = 0;
    /// Never throws.
    virtual TFuture<void> Stop(TShutdownPolicy policy) = 0;
    virtual TFuture<THealth> HealthCheck() = 0;

    virtual bool Running() const = 0;
    /// Exited, or stopped, or never started successfully.
    virtual bool Finished() const = 0;

    /// True when Start() enforces the spec's start timeout itself.
    virtual bool BoundsStart() const {
        return false;
    }

    void Attach(TSupervisor* parent, TChildId id, uint64_t generation) {
        Parent_ = parent;
        ChildId_ = id;
        Generation_ = generation;
    }

protected:
    /// Tells the parent that this instance exited on its own.
    void ReportExit(const TActorExit& exit);

    TSupervisor* Parent_ = nullptr;
    TChildId ChildId_ = 0;
    uint64_t Generation_ = 0;
};

/// What a child factory gets to build an instance.
struct TChildEnv {
    TActorSystem* System;
    /// Stable across restarts of the child.
    TActorAddress Address;
    const TChildSpec* Spec;
};

using TChildFactory = std::function<IChild::TPtr(const TChildEnv&)>;

/**
 * @brief Declarative description of a supervised child.
 *
 * @code
 * auto db = TChildSpec::Actor<TDatabase>("db", connectionString);
 * db.RestartPolicy = ERestartPolicy::Transient;
 * db.Shutdown = TShutdownPolicy::Graceful(std::chrono::seconds(10));
 * @endcode
 */
struct TChildSpec {
    std::string Id;
    TChildFactory Factory;
    ERestartPolicy RestartPolicy = ERestartPolicy::Permanent;
    TShutdownPolicy Shutdown = TShutdownPolicy::Graceful(std::chrono::seconds(5));
    std::chrono::milliseconds StartTimeout = std::chrono::seconds(5);
    /// Bounds the post-stop hook.
    std::chrono::milliseconds ShutdownTimeout = std::chrono::seconds(5);
    /// System default when unset.
    std::optional<TMailboxConfig> Mailbox;

    /// Actor child; every instance is constructed from copies of @p args.
    template<typename T, typename... TArgs>
    static TChildSpec Actor(std::string id, TArgs... args) {
        return FromFactory(std::move(id), [args...]() -> IActor::TPtr {
            return std::make_unique<T>(args...);
        });
    }

    static TChildSpec FromFactory(std::string id, TActorFactory factory);

    /// Nested supervisor that starts @p children in order.
    static TChildSpec Supervisor(std::string id, TSupervisorConfig config, std::vector<TChildSpec> children);

    /// Throws std::invalid_argument for an empty id or a missing factory.
    void Validate() const;
};

/// Supervised actor: one execution cell per instance, registered under the child's stable address.
class TActorChild : public IChild, private ICellObserver {
public:
    TActorChild(const TChildEnv& env, TActorFactory factory);

    TFuture<void> Start() override;
    TFuture<void> Stop(TShutdownPolicy policy) override;
    TFuture<THealth> HealthCheck() override;
    bool Running() const override;
    bool Finished() const override;

    bool BoundsStart() const override {
        return true;
    }

    TActorCell* Cell() {
        return Cell_.get();
    }

private:
    void OnActorExit(TActorCell& cell, const TActorExit& exit) override;

    TActorSystem* System_;
    TActorAddress Address_;
    TMailboxConfig MailboxConfig_;
    TCellOptions Options_;
    TActorFactory Factory_;
    std::unique_ptr<TActorCell> Cell_;
};

} // namespace NActors
} // namespace NActorRt
