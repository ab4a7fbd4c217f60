#include "health_monitor.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace NActorRt {
namespace NActors {

void THealthConfig::Validate() const {
    if (!Enabled) {
        return;
    }
    if (Interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("health check interval must be positive");
    }
    if (Timeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("health check timeout must be positive");
    }
    if (FailureThreshold == 0) {
        throw std::invalid_argument("health failure threshold must be at least 1");
    }
}

std::string_view ToString(EHealthVerdict verdict) {
    switch (verdict) {
    case EHealthVerdict::Healthy: return "healthy";
    case EHealthVerdict::Degraded: return "degraded";
    case EHealthVerdict::Failing: return "failing";
    case EHealthVerdict::Restart: return "restart";
    }
    return "unknown";
}

THealthMonitor::THealthMonitor(THealthConfig config)
    : Config_(config)
{ }

EHealthVerdict THealthMonitor::Record(TChildId child, const THealth& health) {
    switch (health.Status) {
    case EHealthStatus::Healthy:
        Failures_.erase(child);
        return EHealthVerdict::Healthy;
    case EHealthStatus::Degraded:
        return EHealthVerdict::Degraded;
    case EHealthStatus::Failed:
        break;
    }

    auto& failures = Failures_[child];
    if (++failures >= Config_.FailureThreshold) {
        Failures_.erase(child);
        return EHealthVerdict::Restart;
    }
    return EHealthVerdict::Failing;
}

void THealthMonitor::Forget(TChildId child) {
    Failures_.erase(child);
}

uint32_t THealthMonitor::ConsecutiveFailures(TChildId child) const {
    auto it = Failures_.find(child);
    return it == Failures_.end() ? 0 : it->second;
}

TFuture<THealth> THealthMonitor::Probe(TPollerBase* poller, IChild& child) const {
    std::optional<THealth> health;
    std::string failure;
    try {
        health = co_await WithDeadline(poller, child.HealthCheck(), DeadlineAfter(Config_.Timeout));
    } catch (const std::exception& ex) {
        failure = ex.what();
    } catch (...) {
        failure = "unknown exception";
    }

    if (!failure.empty()) {
        co_return THealth::Failed("health check threw: " + failure);
    }
    if (!health) {
        co_return THealth::Failed("health check timed out after " + std::to_string(Config_.Timeout.count()) + "ms");
    }
    co_return std::move(*health);
}

} // namespace NActors
} // namespace NActorRt
