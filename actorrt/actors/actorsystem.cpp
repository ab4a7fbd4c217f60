#include "actorsystem.hpp"

#include <algorithm>
#include <stdexcept>

namespace NActorRt {
namespace NActors {

void TActorSystemConfig::Validate() const {
    if (StartTimeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("start timeout must be positive");
    }
    if (ShutdownTimeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("shutdown timeout must be positive");
    }
}

TActorSystem::TActorSystem(TPollerBase* poller, TActorSystemConfig config)
    : Poller_(poller)
    , Config_(std::move(config))
    , Log_(Config_.LogLevel, Config_.LogSink)
    , Monitor_(Config_.Monitor ? Config_.Monitor : std::make_shared<TInMemoryMonitor>())
    , Broker_(poller)
    , DeadReady_(poller)
{
    Config_.Validate();
    Reaper_ = Reap();
}

TActorSystem::~TActorSystem() {
    Reaper_ = {};
    DeadSupervisors_.clear();
    Dead_.clear();
    Supervisors_.clear();
    Actors_.clear();
}

TActorAddress TActorSystem::Spawn(IActor::TPtr actor, TSpawnOptions options) {
    return SpawnCell(std::move(actor), {}, std::move(options));
}

TActorAddress TActorSystem::Spawn(TActorFactory factory, TSpawnOptions options) {
    if (!factory) {
        throw std::invalid_argument("empty actor factory");
    }
    auto actor = factory();
    return SpawnCell(std::move(actor), std::move(factory), std::move(options));
}

TActorAddress TActorSystem::SpawnCell(IActor::TPtr actor, TActorFactory factory, TSpawnOptions options) {
    if (!actor) {
        throw std::invalid_argument("no actor to spawn");
    }
    if (ShuttingDown_) {
        throw TRegistrationError("actor system is shutting down");
    }
    if (Config_.MaxActors != 0 && Broker_.ActorCount() >= Config_.MaxActors) {
        throw TRegistrationError("actor limit of " + std::to_string(Config_.MaxActors) + " reached");
    }

    auto address = options.Name.empty()
        ? TActorAddress::Anonymous()
        : TActorAddress::Named(options.Name);
    auto mailbox = Broker_.Register(address, options.Mailbox.value_or(Config_.DefaultMailbox));

    TCellOptions cellOptions{
        .StartTimeout = options.StartTimeout.value_or(Config_.StartTimeout),
        .ShutdownTimeout = Config_.ShutdownTimeout,
        .Supervised = false,
        .Factory = std::move(factory)
    };
    auto cell = std::make_unique<TActorCell>(this, address, std::move(mailbox), std::move(actor), std::move(cellOptions));
    cell->SetObserver(this);
    auto* raw = cell.get();
    Actors_.emplace(address, std::move(cell));

    Log_.Debug() << "spawned " << address;
    Report(TRuntimeEvent{.Kind = EEventKind::ActorSpawned, .Source = address.ToString()});
    // may finish (and retire the cell) before returning
    raw->Launch();
    return address;
}

TFuture<TActorAddress> TActorSystem::SpawnSupervised(TChildSpec spec, TSupervisorConfig config) {
    std::string name;
    do {
        name = "supervisor-" + std::to_string(++NextSupervisorId_);
    } while (FindSupervisor(name));

    auto& supervisor = CreateSupervisor(std::move(name), std::move(config));
    supervisor.Disposable_ = true;

    TChildId id = 0;
    std::exception_ptr failure;
    try {
        id = co_await supervisor.StartChild(std::move(spec));
    } catch (...) {
        failure = std::current_exception();
    }
    if (failure) {
        // no-op when the failed start already emptied it
        Dispose(supervisor);
        std::rethrow_exception(failure);
    }
    co_return *supervisor.ChildAddress(id);
}

TSupervisor& TActorSystem::CreateSupervisor(std::string name, TSupervisorConfig config) {
    if (ShuttingDown_) {
        throw TRegistrationError("actor system is shutting down");
    }
    if (FindSupervisor(name)) {
        throw TRegistrationError("supervisor " + name + " already exists");
    }
    auto supervisor = std::make_unique<TSupervisor>(this, std::move(name), std::move(config));
    supervisor->Activate();
    Supervisors_.push_back(std::move(supervisor));
    return *Supervisors_.back();
}

TFuture<void> TActorSystem::Stop(TActorAddress address) {
    auto* cell = Cell(address);
    if (!cell) {
        co_return;
    }
    // the cell retires itself through OnActorStopped
    co_await cell->Stop(TShutdownPolicy::Graceful(Config_.ShutdownTimeout));
}

TFuture<void> TActorSystem::Shutdown() {
    if (ShuttingDown_) {
        co_return;
    }
    ShuttingDown_ = true;
    Log_.Info() << "shutting down " << Supervisors_.size() << " supervisors and " << Actors_.size() << " actors";

    for (auto it = Supervisors_.rbegin(); it != Supervisors_.rend(); ++it) {
        co_await (*it)->Stop(TShutdownPolicy::Graceful(Config_.ShutdownTimeout));
    }

    std::vector<TActorAddress> addresses;
    addresses.reserve(Actors_.size());
    for (const auto& [address, cell] : Actors_) {
        addresses.push_back(address);
    }

    std::vector<TFuture<void>> stops;
    for (const auto& address : addresses) {
        if (auto* cell = Cell(address)) {
            stops.push_back(cell->Stop(TShutdownPolicy::Graceful(Config_.ShutdownTimeout)));
        }
    }
    co_await All(std::move(stops));

    for (const auto& address : addresses) {
        Retire(address);
    }
    Log_.Info() << "shutdown complete";
}

TActorCell* TActorSystem::Cell(const TActorAddress& address) const {
    auto it = Actors_.find(address);
    return it == Actors_.end() ? nullptr : it->second.get();
}

void TActorSystem::OnActorExit(TActorCell& cell, const TActorExit& exit) {
    auto address = cell.Address();
    if (exit.Reason == EExitReason::Error) {
        TSupervisionError error(address.ToString() + ": escalated with no supervisor: " + DescribeError(exit.Error));
        Log_.Error() << error.what();
        Report(TRuntimeEvent{
            .Kind = EEventKind::Escalated,
            .Source = address.ToString(),
            .Detail = error.what()
        });
    }
    Retire(address);
}

void TActorSystem::OnActorStopped(TActorCell& cell) {
    Retire(cell.Address());
}

void TActorSystem::OnRootFailure(TSupervisor& supervisor, const std::exception_ptr& error) {
    if (!FatalError_) {
        FatalError_ = error;
    }
    auto description = DescribeError(error);
    Log_.Error() << "root supervisor " << supervisor.Name() << " failed: " << description;
    Report(TRuntimeEvent{
        .Kind = EEventKind::FatalError,
        .Source = supervisor.Name(),
        .Detail = description
    });
    if (Config_.OnFatalError) {
        Config_.OnFatalError(error);
    }
}

void TActorSystem::Retire(const TActorAddress& address) {
    auto it = Actors_.find(address);
    if (it == Actors_.end()) {
        return;
    }
    // cells are destroyed by the reaper, never from their own frames
    Dead_.push_back(std::move(it->second));
    Actors_.erase(it);
    DeadReady_.NotifyOne();
}

void TActorSystem::Dispose(TSupervisor& supervisor) {
    if (ShuttingDown_) {
        // Shutdown() walks the list
        return;
    }
    auto it = std::find_if(Supervisors_.begin(), Supervisors_.end(),
        [&](const std::unique_ptr<TSupervisor>& item) { return item.get() == &supervisor; });
    if (it == Supervisors_.end()) {
        return;
    }
    Log_.Debug() << "disposing of supervisor " << supervisor.Name();
    DeadSupervisors_.push_back(std::move(*it));
    Supervisors_.erase(it);
    DeadReady_.NotifyOne();
}

TSupervisor* TActorSystem::FindSupervisor(const std::string& name) const {
    for (const auto& supervisor : Supervisors_) {
        if (supervisor->Name() == name) {
            return supervisor.get();
        }
    }
    return nullptr;
}

TFuture<void> TActorSystem::Reap() {
    while (true) {
        while (Dead_.empty() && DeadSupervisors_.empty()) {
            co_await DeadReady_.Wait();
        }
        // resumes scheduled before the retirement still see their objects
        auto supervisors = std::move(DeadSupervisors_);
        auto cells = std::move(Dead_);
        DeadSupervisors_.clear();
        Dead_.clear();
        co_await Poller_->Yield();
        supervisors.clear();
        cells.clear();
    }
}

} // namespace NActors
} // namespace NActorRt
