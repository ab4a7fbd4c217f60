#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

#include <actorrt/base.hpp>

namespace NActorRt {
namespace NActors {

/// Which exits of a child lead to a restart.
enum class ERestartPolicy {
    Permanent,  // always
    Transient,  // only abnormal exits
    Temporary   // never
};

std::string_view ToString(ERestartPolicy policy);

bool ShouldRestart(ERestartPolicy policy, bool abnormalExit);

/// Which children are restarted together with a failed one.
enum class ERestartStrategy {
    OneForOne,   // the failed child
    OneForAll,   // every child
    RestForOne   // the failed child and those registered after it
};

std::string_view ToString(ERestartStrategy strategy);

enum class EChildState {
    Starting,
    Running,
    Stopping,
    Stopped,
    Restarting,
    Failed
};

std::string_view ToString(EChildState state);

/**
 * @brief How long a stopping child may take to finish the message in flight.
 *
 * Graceful waits up to its timeout and then forces termination, Immediate
 * forces it at once, Infinity waits as long as it takes. The post-stop hook
 * runs in every case.
 */
class TShutdownPolicy {
public:
    enum class EKind {
        Graceful,
        Immediate,
        Infinity
    };

    static TShutdownPolicy Graceful(std::chrono::milliseconds timeout) {
        return TShutdownPolicy(EKind::Graceful, timeout);
    }

    static TShutdownPolicy Immediate() {
        return TShutdownPolicy(EKind::Immediate, std::chrono::milliseconds::zero());
    }

    static TShutdownPolicy Infinity() {
        return TShutdownPolicy(EKind::Infinity, std::chrono::milliseconds::zero());
    }

    EKind Kind() const {
        return Kind_;
    }

    /// Grace period; none for Infinity, zero for Immediate.
    std::optional<std::chrono::milliseconds> Timeout() const {
        if (Kind_ == EKind::Infinity) {
            return std::nullopt;
        }
        return Timeout_;
    }

    /// End of the grace period if it started now.
    TTime Deadline() const {
        switch (Kind_) {
        case EKind::Graceful: return DeadlineAfter(Timeout_);
        case EKind::Immediate: return TClock::now();
        case EKind::Infinity: return Never;
        }
        return Never;
    }

    bool operator==(const TShutdownPolicy&) const = default;

private:
    TShutdownPolicy(EKind kind, std::chrono::milliseconds timeout)
        : Kind_(kind)
        , Timeout_(timeout)
    { }

    EKind Kind_;
    std::chrono::milliseconds Timeout_;
};

std::string_view ToString(TShutdownPolicy::EKind kind);

} // namespace NActors
} // namespace NActorRt
