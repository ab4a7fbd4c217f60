#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <unordered_map>

#include <actorrt/corochain.hpp>
#include <actorrt/actors/health.hpp>

#include "child.hpp"

namespace NActorRt {
namespace NActors {

struct THealthConfig {
    bool Enabled = false;
    std::chrono::milliseconds Interval = std::chrono::seconds(30);
    std::chrono::milliseconds Timeout = std::chrono::seconds(5);
    /// Consecutive failed probes that trigger a restart.
    uint32_t FailureThreshold = 3;

    void Validate() const;
};

enum class EHealthVerdict {
    Healthy,
    Degraded,
    Failing,  // failed, threshold not reached yet
    Restart   // threshold reached
};

std::string_view ToString(EHealthVerdict verdict);

/**
 * @brief Turns probe results into restart decisions.
 *
 * Only Failed results count; Healthy resets the count of a child, Degraded
 * leaves it as is. Reaching the threshold yields EHealthVerdict::Restart and
 * resets the count, so a restarted child starts with a clean record.
 */
class THealthMonitor {
public:
    explicit THealthMonitor(THealthConfig config = {});

    EHealthVerdict Record(TChildId child, const THealth& health);
    void Forget(TChildId child);
    uint32_t ConsecutiveFailures(TChildId child) const;

    /// Probes @p child under the configured timeout; a timeout or an exception is a failure.
    TFuture<THealth> Probe(TPollerBase* poller, IChild& child) const;

    const THealthConfig& Config() const {
        return Config_;
    }

private:
    THealthConfig Config_;
    std::unordered_map<TChildId, uint32_t> Failures_;
};

} // namespace NActors
} // namespace NActorRt
