#include "cell.hpp"
#include "actorsystem.hpp"

namespace NActorRt {
namespace NActors {

std::string_view ToString(EActorState state) {
    switch (state) {
    case EActorState::Created: return "created";
    case EActorState::Starting: return "starting";
    case EActorState::Running: return "running";
    case EActorState::Stopping: return "stopping";
    case EActorState::Stopped: return "stopped";
    case EActorState::Restarting: return "restarting";
    }
    return "unknown";
}

std::string_view ToString(EExitReason reason) {
    switch (reason) {
    case EExitReason::Normal: return "normal";
    case EExitReason::Error: return "error";
    case EExitReason::RestartRequested: return "restart_requested";
    case EExitReason::StartFailure: return "start_failure";
    }
    return "unknown";
}

TActorCell::TActorCell(TActorSystem* system, TActorAddress address, std::shared_ptr<TMailbox> mailbox,
                       IActor::TPtr actor, TCellOptions options)
    : System_(system)
    , Address_(std::move(address))
    , Mailbox_(std::move(mailbox))
    , Actor_(std::move(actor))
    , Options_(std::move(options))
    , Context_(system, Address_)
    , StateWaiters_(system->Poller())
    , Exclusive_(system->Poller())
{
    Mailbox_->SetExpiredCallback([this](const TEnvelope& envelope) {
        System_->Report(TRuntimeEvent{
            .Kind = EEventKind::MessageExpired,
            .Source = Address_.ToString(),
            .Subject = std::string(envelope.Message.TypeName())
        });
    });
}

TActorCell::~TActorCell() {
    Stopper_ = {};
    Loop_ = {};
    Starter_ = {};
    Mailbox_->SetExpiredCallback({});
    if (State_ != EActorState::Stopped) {
        System_->Broker().Unregister(Address_);
    }
}

TFuture<void> TActorCell::Start() {
    if (State_ != EActorState::Created) {
        throw TStartError(Address_.ToString() + ": already started");
    }

    State_ = EActorState::Starting;
    std::exception_ptr failure;
    try {
        co_await RunPreStart();
    } catch (...) {
        failure = std::current_exception();
    }

    if (failure) {
        System_->Log().Error() << Address_ << ": " << DescribeError(failure);
        System_->Report(TRuntimeEvent{
            .Kind = EEventKind::StartFailed,
            .Source = Address_.ToString(),
            .Detail = DescribeError(failure)
        });
        Finish(TActorExit{EExitReason::StartFailure, failure}, false);
        std::rethrow_exception(failure);
    }

    State_ = EActorState::Running;
    PostStopPending_ = true;
    Context_.StartedAt_ = TClock::now();
    StateWaiters_.NotifyAll();
    System_->Report(TRuntimeEvent{.Kind = EEventKind::ActorStarted, .Source = Address_.ToString()});
    Loop_ = RunLoop();
}

void TActorCell::Launch() {
    Starter_ = RunMain();
}

TFuture<void> TActorCell::RunMain() {
    std::exception_ptr failure;
    try {
        co_await Start();
    } catch (...) {
        failure = std::current_exception();
    }
    if (failure && Observer_ && !ExternalStop_) {
        Observer_->OnActorExit(*this, TActorExit{EExitReason::StartFailure, failure});
    }
}

TFuture<void> TActorCell::RunPreStart() {
    bool finished = false;
    try {
        finished = co_await WithDeadline(
            Context_.Poller(), Actor_->PreStart(Context_), DeadlineAfter(Options_.StartTimeout));
    } catch (const TStartError&) {
        throw;
    } catch (const std::exception& ex) {
        throw TStartError(Address_.ToString() + ": pre-start failed: " + ex.what());
    } catch (...) {
        throw TStartError(Address_.ToString() + ": pre-start failed: unknown exception");
    }
    if (!finished) {
        throw TStartError(Address_.ToString() + ": pre-start timed out after "
            + std::to_string(Options_.StartTimeout.count()) + "ms", true);
    }
}

TFuture<void> TActorCell::RunPostStop() {
    auto guard = co_await Exclusive_.Lock();
    PostStopPending_ = false;
    PostStopRunning_ = true;
    std::string failure;
    try {
        bool finished = co_await WithDeadline(
            Context_.Poller(), Actor_->PostStop(Context_), DeadlineAfter(Options_.ShutdownTimeout));
        if (!finished) {
            failure = "post-stop timed out after " + std::to_string(Options_.ShutdownTimeout.count()) + "ms";
        }
    } catch (const std::exception& ex) {
        failure = std::string("post-stop failed: ") + ex.what();
    } catch (...) {
        failure = "post-stop failed: unknown exception";
    }
    PostStopRunning_ = false;
    if (!failure.empty()) {
        ReportShutdownError(failure);
    }
}

void TActorCell::ReportShutdownError(const std::string& reason) {
    TShutdownError error(Address_.ToString() + ": " + reason);
    System_->Log().Warning() << error.what();
    System_->Report(TRuntimeEvent{
        .Kind = EEventKind::ShutdownFailed,
        .Source = Address_.ToString(),
        .Detail = error.what()
    });
}

TFuture<void> TActorCell::RunLoop() {
    TActorExit exit;
    while (!Context_.StopRequested() && !ExternalStop_) {
        auto envelope = co_await Mailbox_->Dequeue();
        if (!envelope || ExternalStop_) {
            break;
        }

        Context_.BeginMessage(*envelope);
        std::exception_ptr error;
        {
            auto guard = co_await Exclusive_.Lock();
            try {
                co_await Actor_->Receive(std::move(*envelope), Context_);
            } catch (...) {
                error = std::current_exception();
            }
        }
        Context_.EndMessage();
        if (!error) {
            continue;
        }

        auto action = DecideOnError(error);
        if (action == EErrorAction::Resume) {
            continue;
        } else if (action == EErrorAction::Stop) {
            exit = TActorExit{EExitReason::Normal, error};
            break;
        } else if (action == EErrorAction::Escalate) {
            exit = TActorExit{EExitReason::Error, error};
            break;
        } else if (Options_.Supervised) {
            exit = TActorExit{EExitReason::RestartRequested, error};
            break;
        } else if (!co_await RestartInPlace()) {
            exit = TActorExit{EExitReason::StartFailure, LastStartError_};
            break;
        }
    }

    if (ExternalStop_) {
        // Stop() owns the teardown
        StateWaiters_.NotifyAll();
        co_return;
    }
    co_await Terminate(std::move(exit), true);
}

EErrorAction TActorCell::DecideOnError(const std::exception_ptr& error) {
    auto description = DescribeError(error);
    System_->Log().Warning() << Address_ << ": handler failed: " << description;
    System_->Report(TRuntimeEvent{
        .Kind = EEventKind::HandlerFailed,
        .Source = Address_.ToString(),
        .Detail = description,
        .RestartCount = Context_.RestartCount()
    });

    try {
        return Actor_->OnError(error, Context_);
    } catch (const std::exception& ex) {
        System_->Log().Error() << Address_ << ": error hook failed: " << ex.what() << ", stopping";
    } catch (...) {
        System_->Log().Error() << Address_ << ": error hook failed: unknown exception, stopping";
    }
    return EErrorAction::Stop;
}

TFuture<bool> TActorCell::RestartInPlace() {
    State_ = EActorState::Restarting;
    co_await RunPostStop();

    std::exception_ptr failure;
    if (Options_.Factory) {
        try {
            Actor_ = Options_.Factory();
        } catch (...) {
            failure = std::current_exception();
        }
    }
    Context_.RestartCount_++;
    Context_.StopRequested_ = false;

    if (!failure) {
        State_ = EActorState::Starting;
        try {
            co_await RunPreStart();
        } catch (...) {
            failure = std::current_exception();
        }
    }

    if (failure) {
        LastStartError_ = failure;
        System_->Log().Error() << Address_ << ": restart failed: " << DescribeError(failure);
        System_->Report(TRuntimeEvent{
            .Kind = EEventKind::StartFailed,
            .Source = Address_.ToString(),
            .Detail = DescribeError(failure),
            .RestartCount = Context_.RestartCount()
        });
        co_return false;
    }

    State_ = EActorState::Running;
    PostStopPending_ = true;
    Context_.StartedAt_ = TClock::now();
    System_->Log().Info() << Address_ << ": restarted (" << Context_.RestartCount() << ")";
    System_->Report(TRuntimeEvent{
        .Kind = EEventKind::ActorRestarted,
        .Source = Address_.ToString(),
        .RestartCount = Context_.RestartCount()
    });
    co_return true;
}

TFuture<void> TActorCell::Terminate(TActorExit exit, bool notify) {
    TearingDown_ = true;
    State_ = EActorState::Stopping;
    Mailbox_->Close();
    Mailbox_->Discard();
    if (PostStopPending_) {
        co_await RunPostStop();
    }
    Finish(exit, notify);
}

void TActorCell::Finish(const TActorExit& exit, bool notify) {
    State_ = EActorState::Stopped;
    Mailbox_->Close();
    System_->Broker().Unregister(Address_);

    std::string detail(ToString(exit.Reason));
    if (exit.Error) {
        detail += ": " + DescribeError(exit.Error);
    }
    System_->Report(TRuntimeEvent{
        .Kind = EEventKind::ActorStopped,
        .Source = Address_.ToString(),
        .Detail = detail,
        .RestartCount = Context_.RestartCount()
    });
    StateWaiters_.NotifyAll();

    if (!Observer_) {
        return;
    }
    if (ExternalStop_) {
        Observer_->OnActorStopped(*this);
    } else if (notify) {
        Observer_->OnActorExit(*this, exit);
    }
}

TFuture<void> TActorCell::Stop(TShutdownPolicy policy) {
    if (State_ == EActorState::Stopped) {
        co_return;
    }
    if (!Stopper_.valid()) {
        Stopper_ = RunStop(policy);
    } else if (policy.Kind() == TShutdownPolicy::EKind::Immediate && !ForceStop_) {
        ForceStop_ = true;
        StateWaiters_.NotifyAll();
    }
    while (State_ != EActorState::Stopped) {
        co_await StateWaiters_.Wait();
    }
}

TFuture<void> TActorCell::RunStop(TShutdownPolicy policy) {
    if (State_ == EActorState::Created) {
        ExternalStop_ = true;
        Finish(TActorExit{}, false);
        co_return;
    }

    ExternalStop_ = true;
    Mailbox_->Close();
    Mailbox_->Discard();
    // the caller may be running inside the loop; tear down from the poller
    co_await Context_.Poller()->Yield();

    // the start timeout bounds this wait
    while (State_ == EActorState::Starting) {
        co_await StateWaiters_.Wait();
    }
    if (State_ == EActorState::Stopped) {
        co_return;
    }

    if (!TearingDown_ && policy.Kind() != TShutdownPolicy::EKind::Immediate) {
        auto deadline = policy.Deadline();
        while (LoopActive() && !TearingDown_ && !ForceStop_) {
            if (!co_await StateWaiters_.WaitUntil(deadline)) {
                break;
            }
        }
    }

    if (TearingDown_) {
        while (State_ != EActorState::Stopped) {
            co_await StateWaiters_.Wait();
        }
        co_return;
    }

    TearingDown_ = true;
    if (LoopActive()) {
        System_->Log().Warning() << Address_ << ": forced termination (" << ToString(policy.Kind()) << ")";
        Loop_ = {};
        if (PostStopRunning_) {
            PostStopRunning_ = false;
            ReportShutdownError("post-stop interrupted by forced termination");
        }
    }
    co_await Terminate(TActorExit{}, false);
}

TFuture<THealth> TActorCell::HealthCheck() {
    if (State_ != EActorState::Running) {
        co_return THealth::Failed("actor is " + std::string(ToString(State_)));
    }
    auto guard = co_await Exclusive_.Lock();
    if (State_ != EActorState::Running) {
        co_return THealth::Failed("actor is " + std::string(ToString(State_)));
    }
    co_return co_await Actor_->HealthCheck(Context_);
}

} // namespace NActors
} // namespace NActorRt
