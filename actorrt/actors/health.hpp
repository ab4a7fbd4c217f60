#pragma once

#include <string>
#include <string_view>

namespace NActorRt {
namespace NActors {

enum class EHealthStatus {
    Healthy,
    Degraded,
    Failed
};

std::string_view ToString(EHealthStatus status);

/// Result of a liveness probe.
struct THealth {
    EHealthStatus Status = EHealthStatus::Healthy;
    std::string Reason;

    static THealth Healthy() {
        return {};
    }

    static THealth Degraded(std::string reason) {
        return {EHealthStatus::Degraded, std::move(reason)};
    }

    static THealth Failed(std::string reason) {
        return {EHealthStatus::Failed, std::move(reason)};
    }

    bool IsHealthy() const {
        return Status == EHealthStatus::Healthy;
    }

    bool IsFailed() const {
        return Status == EHealthStatus::Failed;
    }
};

} // namespace NActors
} // namespace NActorRt
