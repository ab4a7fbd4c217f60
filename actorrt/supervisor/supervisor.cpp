#include "supervisor.hpp"

#include <actorrt/actors/actorsystem.hpp>

#include <algorithm>
#include <stdexcept>

namespace NActorRt {
namespace NActors {

namespace {

std::exception_ptr AsStartError(const std::exception_ptr& error, const std::string& prefix) {
    try {
        std::rethrow_exception(error);
    } catch (const TStartError&) {
        return error;
    } catch (...) {
        return std::make_exception_ptr(TStartError(prefix + DescribeError(error)));
    }
}

std::string DescribeExit(const TActorExit& exit) {
    std::string detail(ToString(exit.Reason));
    if (exit.Error) {
        detail += ": " + DescribeError(exit.Error);
    }
    return detail;
}

} // namespace

void IChild::ReportExit(const TActorExit& exit) {
    if (Parent_) {
        Parent_->OnChildExit(ChildId_, Generation_, exit);
    }
}

void TSupervisorConfig::Validate() const {
    Budget.Validate();
    Health.Validate();
}

std::string_view ToString(ESupervisorState state) {
    switch (state) {
    case ESupervisorState::Created: return "created";
    case ESupervisorState::Running: return "running";
    case ESupervisorState::Stopping: return "stopping";
    case ESupervisorState::Stopped: return "stopped";
    case ESupervisorState::Failed: return "failed";
    }
    return "unknown";
}

TChildSpec TChildSpec::Supervisor(std::string id, TSupervisorConfig config, std::vector<TChildSpec> children) {
    config.Validate();
    TChildSpec spec;
    spec.Id = std::move(id);
    spec.Shutdown = TShutdownPolicy::Infinity();
    spec.Factory = [config, children](const TChildEnv& env) -> IChild::TPtr {
        return std::make_unique<TSupervisor>(env.System, env.Address.Name(), config, children);
    };
    return spec;
}

TSupervisor::TSupervisor(TActorSystem* system, std::string name, TSupervisorConfig config,
                         std::vector<TChildSpec> children)
    : System_(system)
    , Name_(std::move(name))
    , Config_(config)
    , InitialChildren_(std::move(children))
    , Backoff_(Config_.Budget)
    , Health_(Config_.Health)
    , SignalsReady_(system->Poller())
    , StateChanged_(system->Poller())
    , Mutex_(system->Poller())
    , JobsDone_(system->Poller())
{
    Config_.Validate();
}

TSupervisor::~TSupervisor() {
    Jobs_.clear();
    Task_ = {};
    HealthTask_ = {};
}

void TSupervisor::Activate() {
    State_ = ESupervisorState::Running;
    Task_ = Run();
    if (Config_.Health.Enabled) {
        HealthTask_ = RunHealthChecks();
    }
    StateChanged_.NotifyAll();
}

TFuture<void> TSupervisor::Start() {
    if (State_ != ESupervisorState::Created) {
        throw TStartError(Name_ + ": already started");
    }
    Activate();

    auto guard = co_await Mutex_.Lock();
    std::exception_ptr failure;
    for (const auto& spec : InitialChildren_) {
        try {
            auto id = AddSlot(spec);
            if (!co_await StartSlot(id)) {
                failure = LastStartError_;
            }
        } catch (...) {
            failure = AsStartError(std::current_exception(), Name_ + ": ");
        }
        if (failure) {
            break;
        }
    }

    if (failure) {
        State_ = ESupervisorState::Stopping;
        HealthTask_ = {};
        SignalsReady_.NotifyAll();
        co_await StopAll(std::nullopt);
        State_ = ESupervisorState::Stopped;
        StateChanged_.NotifyAll();
        std::rethrow_exception(failure);
    }
    System_->Log().Debug() << Name_ << ": started with " << Children_.size() << " children";
}

TFuture<void> TSupervisor::Stop(TShutdownPolicy policy) {
    if (State_ == ESupervisorState::Created) {
        State_ = ESupervisorState::Stopped;
        co_return;
    }
    if (State_ == ESupervisorState::Stopping) {
        while (!Finished()) {
            co_await StateChanged_.Wait();
        }
        co_return;
    }
    if (Finished()) {
        co_return;
    }

    State_ = ESupervisorState::Stopping;
    HealthTask_ = {};
    SignalsReady_.NotifyAll();

    auto guard = co_await Mutex_.Lock();
    std::optional<TShutdownPolicy> override;
    if (policy.Kind() == TShutdownPolicy::EKind::Immediate) {
        override = policy;
    }
    co_await StopAll(override);
    if (State_ == ESupervisorState::Stopping) {
        State_ = ESupervisorState::Stopped;
    }
    StateChanged_.NotifyAll();
    System_->Log().Debug() << Name_ << ": stopped";
}

TFuture<THealth> TSupervisor::HealthCheck() {
    if (State_ != ESupervisorState::Running) {
        co_return THealth::Failed("supervisor is " + std::string(ToString(State_)));
    }
    size_t down = 0;
    for (const auto& slot : Children_) {
        if (slot.State != EChildState::Running) {
            ++down;
        }
    }
    if (down > 0) {
        co_return THealth::Degraded(std::to_string(down) + " of " + std::to_string(Children_.size()) + " children not running");
    }
    co_return THealth::Healthy();
}

TFuture<TChildId> TSupervisor::StartChild(TChildSpec spec) {
    spec.Validate();
    auto guard = co_await Mutex_.Lock();
    if (State_ != ESupervisorState::Running) {
        throw TSupervisionError(Name_ + ": cannot start " + spec.Id + ", supervisor is " + std::string(ToString(State_)));
    }

    auto id = AddSlot(std::move(spec));
    if (!co_await StartSlot(id)) {
        RemoveSlot(id);
        std::rethrow_exception(LastStartError_);
    }
    co_return id;
}

TFuture<bool> TSupervisor::StopChild(TChildId id) {
    return AwaitJob(DoStopChild(id));
}

TFuture<bool> TSupervisor::RestartChild(TChildId id) {
    return AwaitJob(DoRestartChild(id));
}

TFuture<bool> TSupervisor::AwaitJob(TFuture<bool> work) {
    auto state = std::make_shared<TJobState>();
    std::erase_if(Jobs_, [](const TFuture<void>& job) { return job.done(); });
    Jobs_.push_back(RunJob(state, std::move(work)));
    while (!state->Done) {
        co_await JobsDone_.Wait();
    }
    if (state->Error) {
        std::rethrow_exception(state->Error);
    }
    co_return state->Result;
}

TFuture<void> TSupervisor::RunJob(std::shared_ptr<TJobState> state, TFuture<bool> work) {
    try {
        state->Result = co_await work;
    } catch (...) {
        state->Error = std::current_exception();
    }
    state->Done = true;
    JobsDone_.NotifyAll();
}

TFuture<bool> TSupervisor::DoStopChild(TChildId id) {
    auto guard = co_await Mutex_.Lock();
    if (!FindSlot(id)) {
        co_return false;
    }
    co_await StopSlot(id);
    RemoveSlot(id);
    co_return true;
}

TFuture<bool> TSupervisor::DoRestartChild(TChildId id) {
    auto guard = co_await Mutex_.Lock();
    if (State_ != ESupervisorState::Running || !FindSlot(id)) {
        co_return false;
    }

    co_await StopSlot(id);
    auto* slot = FindSlot(id);
    slot->State = EChildState::Restarting;
    slot->RestartCount++;
    if (!co_await StartSlot(id)) {
        // from here on it is an ordinary failed child
        OnChildExit(id, FindSlot(id)->Generation, TActorExit{EExitReason::StartFailure, LastStartError_});
        std::rethrow_exception(LastStartError_);
    }
    Report(EEventKind::ChildRestarted, FindSlot(id), "manual restart");
    co_return true;
}

TFuture<std::optional<THealth>> TSupervisor::CheckChildHealth(TChildId id) {
    auto guard = co_await Mutex_.Lock();
    auto* slot = FindSlot(id);
    if (!slot) {
        co_return std::nullopt;
    }
    if (!slot->Instance || !slot->Instance->Running()) {
        co_return THealth::Failed("child is " + std::string(ToString(slot->State)));
    }
    auto health = co_await Health_.Probe(System_->Poller(), *slot->Instance);
    co_return health;
}

std::vector<TChildId> TSupervisor::ChildIds() const {
    std::vector<TChildId> ids;
    ids.reserve(Children_.size());
    for (const auto& slot : Children_) {
        ids.push_back(slot.Id);
    }
    return ids;
}

std::optional<TChildId> TSupervisor::FindChild(std::string_view id) const {
    for (const auto& slot : Children_) {
        if (slot.Spec.Id == id) {
            return slot.Id;
        }
    }
    return std::nullopt;
}

std::optional<EChildState> TSupervisor::ChildState(TChildId id) const {
    auto* slot = FindSlot(id);
    if (!slot) {
        return std::nullopt;
    }
    return slot->State;
}

std::optional<TActorAddress> TSupervisor::ChildAddress(TChildId id) const {
    auto* slot = FindSlot(id);
    if (!slot) {
        return std::nullopt;
    }
    return slot->Address;
}

IChild* TSupervisor::ChildInstance(TChildId id) const {
    auto* slot = FindSlot(id);
    if (!slot || slot->State != EChildState::Running) {
        return nullptr;
    }
    return slot->Instance.get();
}

uint32_t TSupervisor::ChildRestartCount(TChildId id) const {
    auto* slot = FindSlot(id);
    return slot ? slot->RestartCount : 0;
}

void TSupervisor::OnChildExit(TChildId id, uint64_t generation, TActorExit exit) {
    Signals_.Push(TExitSignal{id, generation, std::move(exit)});
    SignalsReady_.NotifyOne();
}

TFuture<void> TSupervisor::Run() {
    while (State_ == ESupervisorState::Running) {
        TExitSignal signal;
        if (!Signals_.TryPop(signal)) {
            co_await SignalsReady_.Wait();
            continue;
        }

        auto guard = co_await Mutex_.Lock();
        if (State_ != ESupervisorState::Running) {
            break;
        }
        co_await HandleExit(std::move(signal));
    }
}

TFuture<void> TSupervisor::HandleExit(TExitSignal signal) {
    auto* slot = FindSlot(signal.Id);
    if (!slot || slot->Generation != signal.Generation) {
        // the instance was replaced or removed meanwhile
        co_return;
    }

    // health failures arrive while the child is still running
    if (slot->Instance && !slot->Instance->Finished()) {
        slot->State = EChildState::Stopping;
        co_await slot->Instance->Stop(slot->Spec.Shutdown);
        slot = FindSlot(signal.Id);
    }

    bool abnormal = signal.Exit.Abnormal();
    auto detail = DescribeExit(signal.Exit);
    slot->State = abnormal ? EChildState::Failed : EChildState::Stopped;
    Report(abnormal ? EEventKind::ChildFailed : EEventKind::ChildStopped, slot, detail);
    if (abnormal) {
        System_->Log().Warning() << Name_ << ": child " << slot->Spec.Id << " failed: " << detail;
    }

    if (!ShouldRestart(slot->Spec.RestartPolicy, abnormal)) {
        System_->Log().Info() << Name_ << ": child " << slot->Spec.Id << " exited ("
            << detail << "), " << ToString(slot->Spec.RestartPolicy) << " child not restarted";
        Health_.Forget(signal.Id);
        RemoveSlot(signal.Id);
        co_return;
    }

    // a Restart decision concerns the actor alone
    auto targets = signal.Exit.Reason == EExitReason::RestartRequested
        ? std::vector<TChildId>{signal.Id}
        : SelectTargets(signal.Id);
    co_await RestartChildren(std::move(targets), signal.Id);
}

TFuture<void> TSupervisor::RestartChildren(std::vector<TChildId> targets, TChildId failed) {
    if (State_ != ESupervisorState::Running) {
        co_return;
    }

    auto now = TClock::now();
    if (Backoff_.IsLimitExceeded(now)) {
        co_await Fail("restart limit exceeded: " + std::to_string(Config_.Budget.MaxRestarts)
            + " restarts within " + std::to_string(Config_.Budget.Window.count()) + "ms");
        co_return;
    }
    auto delay = Backoff_.NextDelay(now);
    Backoff_.RecordRestart(now);
    Report(EEventKind::StrategyApplied, FindSlot(failed),
        std::string(ToString(Config_.Strategy)) + ", " + std::to_string(targets.size()) + " children");

    for (auto it = targets.rbegin(); it != targets.rend(); ++it) {
        if (*it != failed) {
            co_await StopSlot(*it);
        }
    }
    for (auto id : targets) {
        if (auto* slot = FindSlot(id)) {
            slot->State = EChildState::Restarting;
        }
    }

    if (delay > std::chrono::milliseconds::zero()) {
        co_await System_->Poller()->Sleep(delay);
    }

    for (auto id : targets) {
        auto* slot = FindSlot(id);
        if (!slot) {
            continue;
        }
        if (id != failed && slot->Spec.RestartPolicy == ERestartPolicy::Temporary) {
            Report(EEventKind::ChildStopped, slot, "temporary child removed with its siblings");
            RemoveSlot(id);
            continue;
        }

        slot->RestartCount++;
        if (!co_await StartSlot(id)) {
            // retried through the regular failure path; the remaining targets are part of that restart
            OnChildExit(id, FindSlot(id)->Generation, TActorExit{EExitReason::StartFailure, LastStartError_});
            break;
        }
        Report(EEventKind::ChildRestarted, FindSlot(id));
    }
}

TFuture<bool> TSupervisor::StartSlot(TChildId id) {
    auto* slot = FindSlot(id);
    slot->Generation++;
    slot->Instance.reset();
    if (slot->State != EChildState::Restarting) {
        slot->State = EChildState::Starting;
    }

    std::exception_ptr failure;
    try {
        slot->Instance = slot->Spec.Factory(TChildEnv{System_, slot->Address, &slot->Spec});
        if (!slot->Instance) {
            throw TStartError(Name_ + "/" + slot->Spec.Id + ": factory returned no instance");
        }
        slot->Instance->Attach(this, slot->Id, slot->Generation);
        if (slot->Instance->BoundsStart()) {
            co_await slot->Instance->Start();
        } else {
            auto timeout = slot->Spec.StartTimeout;
            auto name = Name_ + "/" + slot->Spec.Id;
            auto deadline = DeadlineAfter(timeout);
            if (!co_await WithDeadline(System_->Poller(), slot->Instance->Start(), deadline)) {
                throw TStartError(name + ": start timed out after " + std::to_string(timeout.count()) + "ms", true);
            }
        }
    } catch (...) {
        failure = std::current_exception();
    }

    slot = FindSlot(id);
    if (failure) {
        LastStartError_ = AsStartError(failure, Name_ + "/" + slot->Spec.Id + ": ");
        slot->State = EChildState::Failed;
        slot->Instance.reset();
        System_->Log().Error() << Name_ << ": child " << slot->Spec.Id << " failed to start: " << DescribeError(failure);
        Report(EEventKind::StartFailed, slot, DescribeError(failure));
        co_return false;
    }

    slot->State = EChildState::Running;
    Health_.Forget(id);
    Report(EEventKind::ChildStarted, slot);
    co_return true;
}

TFuture<void> TSupervisor::StopSlot(TChildId id, std::optional<TShutdownPolicy> policy) {
    auto* slot = FindSlot(id);
    if (!slot) {
        co_return;
    }
    if (!slot->Instance || slot->Instance->Finished()) {
        if (slot->State == EChildState::Running) {
            slot->State = EChildState::Stopped;
        }
        co_return;
    }

    slot->State = EChildState::Stopping;
    co_await slot->Instance->Stop(policy.value_or(slot->Spec.Shutdown));
    slot = FindSlot(id);
    if (slot) {
        slot->State = EChildState::Stopped;
        Report(EEventKind::ChildStopped, slot, "stopped by supervisor");
    }
}

TFuture<void> TSupervisor::StopAll(std::optional<TShutdownPolicy> policy) {
    auto ids = ChildIds();
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
        co_await StopSlot(*it, policy);
    }
}

TFuture<void> TSupervisor::Fail(std::string reason) {
    auto error = std::make_exception_ptr(TSupervisionError(Name_ + ": " + reason));
    System_->Log().Error() << Name_ << ": " << reason << ", stopping all children";
    System_->Report(TRuntimeEvent{
        .Kind = EEventKind::RestartLimitExceeded,
        .Source = Name_,
        .Detail = reason,
        .RestartCount = Backoff_.RestartCount()
    });

    State_ = ESupervisorState::Stopping;
    HealthTask_ = {};
    SignalsReady_.NotifyAll();
    co_await StopAll(std::nullopt);
    State_ = ESupervisorState::Failed;
    StateChanged_.NotifyAll();

    if (Parent_) {
        System_->Report(TRuntimeEvent{.Kind = EEventKind::Escalated, .Source = Name_, .Detail = reason});
        ReportExit(TActorExit{EExitReason::Error, error});
    } else {
        System_->OnRootFailure(*this, error);
        if (Disposable_) {
            System_->Dispose(*this);
        }
    }
}

TFuture<void> TSupervisor::RunHealthChecks() {
    while (State_ == ESupervisorState::Running) {
        co_await System_->Poller()->Sleep(Config_.Health.Interval);
        if (State_ != ESupervisorState::Running) {
            break;
        }
        auto guard = co_await Mutex_.Lock();
        if (State_ != ESupervisorState::Running) {
            break;
        }
        co_await ProbeChildren();
    }
}

TFuture<void> TSupervisor::ProbeChildren() {
    for (auto id : ChildIds()) {
        auto* slot = FindSlot(id);
        if (!slot || slot->State != EChildState::Running || !slot->Instance || !slot->Instance->Running()) {
            continue;
        }

        auto generation = slot->Generation;
        auto health = co_await Health_.Probe(System_->Poller(), *slot->Instance);
        slot = FindSlot(id);
        if (!slot || slot->Generation != generation) {
            continue;
        }

        switch (Health_.Record(id, health)) {
        case EHealthVerdict::Healthy:
            break;
        case EHealthVerdict::Degraded:
            Report(EEventKind::HealthDegraded, slot, health.Reason);
            break;
        case EHealthVerdict::Failing:
            Report(EEventKind::HealthFailed, slot, health.Reason);
            break;
        case EHealthVerdict::Restart:
            Report(EEventKind::HealthFailed, slot, health.Reason);
            System_->Log().Warning() << Name_ << ": child " << slot->Spec.Id << " failed "
                << Config_.Health.FailureThreshold << " health checks in a row: " << health.Reason;
            OnChildExit(id, generation, TActorExit{
                EExitReason::Error,
                std::make_exception_ptr(TActorError("health check failed: " + health.Reason))});
            break;
        }
    }
}

TChildId TSupervisor::AddSlot(TChildSpec spec) {
    spec.Validate();
    if (FindChild(spec.Id)) {
        throw std::invalid_argument(Name_ + ": duplicate child id " + spec.Id);
    }
    TChildSlot slot;
    slot.Id = NextChildId_++;
    slot.Address = TActorAddress::Named(Name_ + "/" + spec.Id);
    slot.Spec = std::move(spec);
    Children_.push_back(std::move(slot));
    return Children_.back().Id;
}

void TSupervisor::RemoveSlot(TChildId id) {
    Health_.Forget(id);
    std::erase_if(Children_, [id](const TChildSlot& slot) { return slot.Id == id; });

    if (Disposable_ && Children_.empty() && State_ == ESupervisorState::Running) {
        State_ = ESupervisorState::Stopped;
        HealthTask_ = {};
        SignalsReady_.NotifyAll();
        StateChanged_.NotifyAll();
        System_->Dispose(*this);
    }
}

TSupervisor::TChildSlot* TSupervisor::FindSlot(TChildId id) {
    auto it = std::find_if(Children_.begin(), Children_.end(), [id](const TChildSlot& slot) { return slot.Id == id; });
    return it == Children_.end() ? nullptr : &*it;
}

const TSupervisor::TChildSlot* TSupervisor::FindSlot(TChildId id) const {
    auto it = std::find_if(Children_.begin(), Children_.end(), [id](const TChildSlot& slot) { return slot.Id == id; });
    return it == Children_.end() ? nullptr : &*it;
}

std::vector<TChildId> TSupervisor::SelectTargets(TChildId failed) const {
    switch (Config_.Strategy) {
    case ERestartStrategy::OneForOne:
        return {failed};
    case ERestartStrategy::OneForAll:
        return ChildIds();
    case ERestartStrategy::RestForOne: {
        std::vector<TChildId> targets;
        bool found = false;
        for (const auto& slot : Children_) {
            found = found || slot.Id == failed;
            if (found) {
                targets.push_back(slot.Id);
            }
        }
        return targets;
    }
    }
    return {failed};
}

void TSupervisor::Report(EEventKind kind, const TChildSlot* slot, std::string detail) {
    System_->Report(TRuntimeEvent{
        .Kind = kind,
        .Source = Name_,
        .Subject = slot ? slot->Spec.Id : std::string(),
        .Detail = std::move(detail),
        .RestartCount = slot ? slot->RestartCount : 0
    });
}

} // namespace NActors
} // namespace NActorRt
