#pragma once

#include <chrono>
#include <cstdint>
#include <deque>

#include <actorrt/base.hpp>

namespace NActorRt {
namespace NActors {

/// At most MaxRestarts restarts within any sliding Window.
struct TRestartBudget {
    uint32_t MaxRestarts = 5;
    std::chrono::milliseconds Window = std::chrono::seconds(60);
    std::chrono::milliseconds BaseDelay = std::chrono::milliseconds(100);
    std::chrono::milliseconds MaxDelay = std::chrono::seconds(60);

    /// Throws std::invalid_argument for a zero window or BaseDelay > MaxDelay.
    void Validate() const;
};

/**
 * @brief Sliding-window restart accounting with exponential delays.
 *
 * Restarts older than the window are forgotten, so a child that fails
 * rarely is restarted forever while a crash loop exhausts the budget.
 * The delay before the n-th restart in the window (counting from 0) is
 * BaseDelay * 2^min(n, 10), capped at MaxDelay.
 */
class TRestartBackoff {
public:
    explicit TRestartBackoff(TRestartBudget budget = {});

    /// True when another restart now would exceed the budget.
    bool IsLimitExceeded(TTime now = TClock::now());

    void RecordRestart(TTime now = TClock::now());

    std::chrono::milliseconds NextDelay(TTime now = TClock::now());

    /// Restarts inside the window ending at @p now.
    uint32_t RestartCount(TTime now = TClock::now());

    void Reset();

    const TRestartBudget& Budget() const {
        return Budget_;
    }

private:
    void Prune(TTime now);

    TRestartBudget Budget_;
    std::deque<TTime> History_;
};

} // namespace NActors
} // namespace NActorRt
