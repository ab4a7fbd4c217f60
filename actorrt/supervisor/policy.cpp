#include "policy.hpp"

namespace NActorRt {
namespace NActors {

std::string_view ToString(ERestartPolicy policy) {
    switch (policy) {
    case ERestartPolicy::Permanent: return "permanent";
    case ERestartPolicy::Transient: return "transient";
    case ERestartPolicy::Temporary: return "temporary";
    }
    return "unknown";
}

bool ShouldRestart(ERestartPolicy policy, bool abnormalExit) {
    switch (policy) {
    case ERestartPolicy::Permanent: return true;
    case ERestartPolicy::Transient: return abnormalExit;
    case ERestartPolicy::Temporary: return false;
    }
    return false;
}

std::string_view ToString(ERestartStrategy strategy) {
    switch (strategy) {
    case ERestartStrategy::OneForOne: return "one_for_one";
    case ERestartStrategy::OneForAll: return "one_for_all";
    case ERestartStrategy::RestForOne: return "rest_for_one";
    }
    return "unknown";
}

std::string_view ToString(EChildState state) {
    switch (state) {
    case EChildState::Starting: return "starting";
    case EChildState::Running: return "running";
    case EChildState::Stopping: return "stopping";
    case EChildState::Stopped: return "stopped";
    case EChildState::Restarting: return "restarting";
    case EChildState::Failed: return "failed";
    }
    return "unknown";
}

std::string_view ToString(TShutdownPolicy::EKind kind) {
    switch (kind) {
    case TShutdownPolicy::EKind::Graceful: return "graceful";
    case TShutdownPolicy::EKind::Immediate: return "immediate";
    case TShutdownPolicy::EKind::Infinity: return "infinity";
    }
    return "unknown";
}

} // namespace NActors
} // namespace NActorRt
