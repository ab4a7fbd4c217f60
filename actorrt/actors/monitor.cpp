#include "monitor.hpp"

#include <algorithm>

namespace NActorRt {
namespace NActors {

std::string_view ToString(ESeverity severity) {
    switch (severity) {
    case ESeverity::Trace: return "trace";
    case ESeverity::Debug: return "debug";
    case ESeverity::Info: return "info";
    case ESeverity::Warning: return "warning";
    case ESeverity::Error: return "error";
    case ESeverity::Critical: return "critical";
    }
    return "unknown";
}

std::string_view ToString(EEventKind kind) {
    switch (kind) {
    case EEventKind::ActorSpawned: return "actor_spawned";
    case EEventKind::ActorStarted: return "actor_started";
    case EEventKind::ActorStopped: return "actor_stopped";
    case EEventKind::ActorRestarted: return "actor_restarted";
    case EEventKind::HandlerFailed: return "handler_failed";
    case EEventKind::StartFailed: return "start_failed";
    case EEventKind::ShutdownFailed: return "shutdown_failed";
    case EEventKind::MessageExpired: return "message_expired";
    case EEventKind::ChildStarted: return "child_started";
    case EEventKind::ChildStopped: return "child_stopped";
    case EEventKind::ChildFailed: return "child_failed";
    case EEventKind::ChildRestarted: return "child_restarted";
    case EEventKind::StrategyApplied: return "strategy_applied";
    case EEventKind::RestartLimitExceeded: return "restart_limit_exceeded";
    case EEventKind::Escalated: return "escalated";
    case EEventKind::HealthDegraded: return "health_degraded";
    case EEventKind::HealthFailed: return "health_failed";
    case EEventKind::FatalError: return "fatal_error";
    }
    return "unknown";
}

ESeverity SeverityOf(EEventKind kind) {
    switch (kind) {
    case EEventKind::MessageExpired:
        return ESeverity::Trace;
    case EEventKind::ActorSpawned:
    case EEventKind::ActorStarted:
    case EEventKind::ActorStopped:
    case EEventKind::StrategyApplied:
        return ESeverity::Debug;
    case EEventKind::ChildStarted:
    case EEventKind::ChildStopped:
        return ESeverity::Info;
    case EEventKind::ActorRestarted:
    case EEventKind::HandlerFailed:
    case EEventKind::ShutdownFailed:
    case EEventKind::ChildRestarted:
    case EEventKind::HealthDegraded:
        return ESeverity::Warning;
    case EEventKind::StartFailed:
    case EEventKind::ChildFailed:
    case EEventKind::Escalated:
    case EEventKind::HealthFailed:
        return ESeverity::Error;
    case EEventKind::RestartLimitExceeded:
    case EEventKind::FatalError:
        return ESeverity::Critical;
    }
    return ESeverity::Info;
}

TInMemoryMonitor::TInMemoryMonitor(size_t maxHistory)
    : MaxHistory_(maxHistory)
{ }

void TInMemoryMonitor::Record(const TRuntimeEvent& event) {
    std::lock_guard lock(Mutex_);
    Counters_.Total++;
    Counters_.ByKind[static_cast<size_t>(event.Kind)]++;
    Counters_.BySeverity[static_cast<size_t>(event.Severity())]++;
    if (MaxHistory_ == 0) {
        return;
    }
    if (History_.size() == MaxHistory_) {
        History_.pop_front();
    }
    History_.push_back(event);
}

TInMemoryMonitor::TSnapshot TInMemoryMonitor::Snapshot(size_t recent) const {
    std::lock_guard lock(Mutex_);
    TSnapshot snapshot;
    snapshot.Total = Counters_.Total;
    snapshot.ByKind = Counters_.ByKind;
    snapshot.BySeverity = Counters_.BySeverity;
    auto count = std::min(recent, History_.size());
    snapshot.Recent.assign(History_.end() - count, History_.end());
    return snapshot;
}

uint64_t TInMemoryMonitor::Count(EEventKind kind) const {
    std::lock_guard lock(Mutex_);
    return Counters_.ByKind[static_cast<size_t>(kind)];
}

uint64_t TInMemoryMonitor::Count(ESeverity severity) const {
    std::lock_guard lock(Mutex_);
    return Counters_.BySeverity[static_cast<size_t>(severity)];
}

std::vector<TRuntimeEvent> TInMemoryMonitor::Events(EEventKind kind) const {
    std::lock_guard lock(Mutex_);
    std::vector<TRuntimeEvent> events;
    for (const auto& event : History_) {
        if (event.Kind == kind) {
            events.push_back(event);
        }
    }
    return events;
}

std::vector<TRuntimeEvent> TInMemoryMonitor::History() const {
    std::lock_guard lock(Mutex_);
    return {History_.begin(), History_.end()};
}

void TInMemoryMonitor::Reset() {
    std::lock_guard lock(Mutex_);
    History_.clear();
    Counters_ = {};
}

} // namespace NActors
} // namespace NActorRt
