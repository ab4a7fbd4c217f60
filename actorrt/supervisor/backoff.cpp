#include "backoff.hpp"

#include <algorithm>
#include <stdexcept>

namespace NActorRt {
namespace NActors {

void TRestartBudget::Validate() const {
    if (Window <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("restart window must be positive");
    }
    if (BaseDelay < std::chrono::milliseconds::zero() || BaseDelay > MaxDelay) {
        throw std::invalid_argument("restart base delay must be within [0, max delay]");
    }
}

TRestartBackoff::TRestartBackoff(TRestartBudget budget)
    : Budget_(budget)
{ }

bool TRestartBackoff::IsLimitExceeded(TTime now) {
    Prune(now);
    return History_.size() >= Budget_.MaxRestarts;
}

void TRestartBackoff::RecordRestart(TTime now) {
    Prune(now);
    History_.push_back(now);
}

std::chrono::milliseconds TRestartBackoff::NextDelay(TTime now) {
    Prune(now);
    if (Budget_.BaseDelay == std::chrono::milliseconds::zero()) {
        return Budget_.BaseDelay;
    }
    auto exponent = std::min<size_t>(History_.size(), 10);
    auto delay = Budget_.BaseDelay * (int64_t{1} << exponent);
    return std::min(delay, Budget_.MaxDelay);
}

uint32_t TRestartBackoff::RestartCount(TTime now) {
    Prune(now);
    return static_cast<uint32_t>(History_.size());
}

void TRestartBackoff::Reset() {
    History_.clear();
}

void TRestartBackoff::Prune(TTime now) {
    while (!History_.empty() && now - History_.front() > Budget_.Window) {
        History_.pop_front();
    }
}

} // namespace NActors
} // namespace NActorRt
