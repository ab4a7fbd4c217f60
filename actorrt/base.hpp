#pragma once

#include <chrono>
#include <coroutine>
#include <tuple>

#include <time.h>

namespace NActorRt {

using TClock = std::chrono::steady_clock;
using TTime = TClock::time_point;
using THandle = std::coroutine_handle<>;

/// Timeout value meaning "wait forever".
inline constexpr TTime Never = TTime::max();

struct TTimer {
    TTime Deadline;
    unsigned Id;
    THandle Handle;
    bool operator<(const TTimer& e) const {
        return std::tuple(Deadline, Id, static_cast<bool>(Handle)) > std::tuple(e.Deadline, e.Id, static_cast<bool>(e.Handle));
    }
};

template<typename T1, typename T2>
inline std::tuple<T1, T2>
GetDurationPair(TTime now, TTime deadline, std::chrono::milliseconds maxDuration)
{
    if (now > deadline) {
        return std::make_tuple(T1(0), T2(0));
    } else {
        auto duration = (deadline - now);
        if (duration > maxDuration) {
            duration = maxDuration;
        }
        auto part1 = std::chrono::duration_cast<T1>(duration);
        duration -= part1;
        auto part2 = std::chrono::duration_cast<T2>(duration);

        return std::make_tuple(part1, part2);
    }
}

inline timespec GetTimespec(TTime now, TTime deadline, std::chrono::milliseconds maxDuration)
{
    auto [p1, p2] = GetDurationPair<std::chrono::seconds, std::chrono::nanoseconds>(now, deadline, maxDuration);
    timespec ret;
    ret.tv_sec = p1.count();
    ret.tv_nsec = p2.count();
    return ret;
}

/// Deadline `duration` from now, saturating to Never for very long durations.
template<typename Rep, typename Period>
inline TTime DeadlineAfter(std::chrono::duration<Rep, Period> duration)
{
    auto now = TClock::now();
    if (duration >= std::chrono::duration_cast<std::chrono::duration<Rep, Period>>(Never - now)) {
        return Never;
    }
    return now + std::chrono::duration_cast<TClock::duration>(duration);
}

} // namespace NActorRt
