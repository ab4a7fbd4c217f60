#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <string_view>

#include <actorrt/corochain.hpp>
#include <actorrt/sync.hpp>
#include <actorrt/supervisor/policy.hpp>

#include "actor.hpp"
#include "mailbox.hpp"

namespace NActorRt {
namespace NActors {

class TActorSystem;
class TActorCell;

enum class EActorState {
    Created,
    Starting,
    Running,
    Stopping,
    Stopped,
    Restarting
};

std::string_view ToString(EActorState state);

enum class EExitReason {
    Normal,            // self stop, Stop decision
    Error,             // Escalate decision
    RestartRequested,  // Restart decision of a supervised actor
    StartFailure       // pre-start failed
};

std::string_view ToString(EExitReason reason);

struct TActorExit {
    EExitReason Reason = EExitReason::Normal;
    std::exception_ptr Error;

    bool Abnormal() const {
        return Reason != EExitReason::Normal;
    }
};

/// Told about exits the cell initiated itself; stops requested from outside are not reported as exits.
class ICellObserver {
public:
    virtual ~ICellObserver() = default;
    virtual void OnActorExit(TActorCell& cell, const TActorExit& exit) = 0;
    /// A stop requested from outside has finished.
    virtual void OnActorStopped(TActorCell&) { }
};

struct TCellOptions {
    std::chrono::milliseconds StartTimeout = std::chrono::seconds(5);
    /// Bounds the post-stop hook.
    std::chrono::milliseconds ShutdownTimeout = std::chrono::seconds(5);
    /// A supervised cell hands Restart and Escalate decisions to its observer.
    bool Supervised = false;
    /// Builds the replacement instance of an unsupervised in-place restart; the old instance is reused when empty.
    TActorFactory Factory;
};

/**
 * @brief Runs one actor: lifecycle hooks and the message loop.
 *
 * State machine:
 * @code
 * Created -> Starting -> Running -> Stopping -> Stopped
 *               |           |  ^
 *               |           v  |
 *               |        Restarting   (unsupervised Restart decision)
 *               +-> Stopped           (pre-start failed or timed out)
 * @endcode
 *
 * The loop takes one envelope at a time and awaits the handler before the
 * next dequeue. Health checks and the post-stop hook take the same lock as
 * the handler, so the actor's state is never touched concurrently. The
 * cell unregisters its address before it reports the exit, so a supervisor
 * may register a replacement under the same address right away.
 *
 * A cell must outlive its loop; the loop is never destroyed from its own
 * frame (owners reap finished cells later).
 */
class TActorCell {
public:
    TActorCell(TActorSystem* system, TActorAddress address, std::shared_ptr<TMailbox> mailbox,
               IActor::TPtr actor, TCellOptions options = {});
    ~TActorCell();

    TActorCell(const TActorCell&) = delete;
    TActorCell& operator=(const TActorCell&) = delete;

    /**
     * @brief Runs the pre-start hook, then starts the message loop.
     *
     * Throws TStartError when the hook fails or exceeds the start timeout;
     * the cell is Stopped and its address released in that case.
     */
    TFuture<void> Start();

    /// Start() in the background; a failure is reported to the observer as EExitReason::StartFailure.
    void Launch();

    /**
     * @brief Stops the actor from outside.
     *
     * The mailbox is closed at once and queued envelopes are discarded; the
     * handler in flight may finish within the policy's grace period, after
     * which the loop is destroyed. The post-stop hook runs either way.
     * Never throws; post-stop failures are reported as events.
     *
     * The teardown runs on a task owned by the cell, so the caller may be
     * the actor's own handler. Such a caller is destroyed with the loop when
     * the grace period ends; ctx.Stop() ends the actor without waiting.
     * A later Immediate stop cuts a pending grace period short.
     */
    TFuture<void> Stop(TShutdownPolicy policy);

    /// Health of the running actor; Failed in every other state. Waits for the handler in flight.
    TFuture<THealth> HealthCheck();

    EActorState State() const {
        return State_;
    }

    bool Running() const {
        return State_ == EActorState::Running;
    }

    bool Finished() const {
        return State_ == EActorState::Stopped;
    }

    const TActorAddress& Address() const {
        return Address_;
    }

    TActorContext& Context() {
        return Context_;
    }

    TMailbox& Mailbox() {
        return *Mailbox_;
    }

    void SetObserver(ICellObserver* observer) {
        Observer_ = observer;
    }

private:
    bool LoopActive() const {
        return Loop_.valid() && !Loop_.done();
    }

    TFuture<void> RunPreStart();
    TFuture<void> RunPostStop();
    TFuture<void> RunMain();
    TFuture<void> RunLoop();
    TFuture<bool> RestartInPlace();
    TFuture<void> RunStop(TShutdownPolicy policy);
    TFuture<void> Terminate(TActorExit exit, bool notify);
    EErrorAction DecideOnError(const std::exception_ptr& error);
    void ReportShutdownError(const std::string& reason);
    void Finish(const TActorExit& exit, bool notify);

    TActorSystem* System_;
    TActorAddress Address_;
    std::shared_ptr<TMailbox> Mailbox_;
    IActor::TPtr Actor_;
    TCellOptions Options_;
    TActorContext Context_;
    TWaitList StateWaiters_;
    // held by handlers, hooks run from the loop and health checks
    TAsyncMutex Exclusive_;
    ICellObserver* Observer_ = nullptr;
    EActorState State_ = EActorState::Created;
    std::exception_ptr LastStartError_;
    bool ExternalStop_ = false;
    bool TearingDown_ = false;
    bool PostStopPending_ = false;
    bool PostStopRunning_ = false;
    bool ForceStop_ = false;
    TFuture<void> Starter_;
    TFuture<void> Stopper_;
    TFuture<void> Loop_;
};

} // namespace NActors
} // namespace NActorRt
