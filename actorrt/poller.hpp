#pragma once

#include <chrono>
#include <vector>
#include <queue>

#include "base.hpp"

#ifdef Yield
#undef Yield
#endif

namespace NActorRt {

/**
 * @class TPollerBase
 * @brief Timer queue that drives every suspended coroutine of the runtime.
 *
 * Coroutines are resumed only from @ref ProcessTimers(), never from the stack of
 * whoever made them runnable. A coroutine that must run "as soon as possible"
 * (a mailbox receiver that got a message, a waiter that got notified) is
 * scheduled with @ref ScheduleResume(), which is a timer with a zero deadline.
 *
 * Cancelling a timer does not search the heap: @ref RemoveTimer() pushes an
 * empty timer with the same deadline and id, which sorts right before the real
 * one, and @ref ProcessTimers() skips the entry that follows it.
 */
class TPollerBase {
public:
    TPollerBase() = default;

    TPollerBase(const TPollerBase& ) = delete;
    TPollerBase& operator=(const TPollerBase& ) = delete;

    /**
     * @brief Schedules a timer.
     *
     * @param deadline The time at which the timer should fire.
     * @param h        The handle of the coroutine to resume when the timer expires.
     * @return A unique timer ID.
     */
    unsigned AddTimer(TTime deadline, THandle h) {
        Timers_.emplace(TTimer{deadline, TimerId_, h});
        return TimerId_++;
    }

    /**
     * @brief Cancels a timer.
     *
     * @param timerId  The timer ID to remove.
     * @param deadline The deadline the timer was scheduled with.
     * @return True if the timer had already fired; false otherwise.
     */
    bool RemoveTimer(unsigned timerId, TTime deadline) {
        bool fired = timerId == LastFiredTimer_;
        if (!fired) {
            Timers_.emplace(TTimer{deadline, timerId, {}}); // insert empty timer before existing
        }
        return fired;
    }

    /// Resumes @p h on the next timer pass.
    unsigned ScheduleResume(THandle h) {
        return AddTimer(TTime{}, h);
    }

    /// Cancels a resume scheduled with @ref ScheduleResume().
    void CancelResume(unsigned timerId) {
        RemoveTimer(timerId, TTime{});
    }

    /**
     * @brief Suspends execution until the specified time.
     *
     * The returned awaitable cancels its timer if the awaiting coroutine is
     * destroyed before the deadline.
     */
    auto Sleep(TTime until) {
        struct TAwaitableSleep {
            TAwaitableSleep(TPollerBase* poller, TTime n)
                : poller(poller)
                , n(n)
            { }
            ~TAwaitableSleep() {
                if (poller && suspended) {
                    poller->RemoveTimer(timerId, n);
                }
            }

            TAwaitableSleep(TAwaitableSleep&& other)
                : poller(other.poller)
                , n(other.n)
            {
                other.poller = nullptr;
            }

            TAwaitableSleep(const TAwaitableSleep&) = delete;
            TAwaitableSleep& operator=(const TAwaitableSleep&) = delete;

            bool await_ready() {
                return false;
            }

            void await_suspend(std::coroutine_handle<> h) {
                timerId = poller->AddTimer(n, h);
                suspended = true;
            }

            void await_resume() { poller = nullptr; }

            TPollerBase* poller;
            TTime n;
            unsigned timerId = 0;
            bool suspended = false;
        };

        return TAwaitableSleep{this, until};
    }

    template<typename Rep, typename Period>
    auto Sleep(std::chrono::duration<Rep,Period> duration) {
        return Sleep(TClock::now() + duration);
    }

    /// Gives every other runnable coroutine a chance to run first.
    auto Yield() {
        return Sleep(TTime{});
    }

    void SetMaxDuration(std::chrono::milliseconds maxDuration) {
        MaxDuration_ = maxDuration;
        MaxDurationTs_ = GetMaxDuration(MaxDuration_);
    }

    /// Returns the number of scheduled timers, cancelled ones included.
    auto TimersSize() const {
        return Timers_.size();
    }

protected:
    /// Time to wait for the earliest timer, capped by the maximum poll duration.
    timespec GetTimeout() const {
        return Timers_.empty()
            ? MaxDurationTs_
            : Timers_.top().Deadline == TTime{}
                ? timespec {0, 0}
                : GetTimespec(TClock::now(), Timers_.top().Deadline, MaxDuration_);
    }

    static constexpr timespec GetMaxDuration(std::chrono::milliseconds duration) {
        auto p1 = std::chrono::duration_cast<std::chrono::seconds>(duration);
        auto p2 = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - p1);
        timespec ts;
        ts.tv_sec = p1.count();
        ts.tv_nsec = p2.count();
        return ts;
    }

    /**
     * @brief Resumes the coroutines of every expired timer.
     *
     * Timers added by resumed coroutines with an already passed deadline
     * (zero-deadline resumes in particular) run in the same pass.
     */
    void ProcessTimers() {
        auto now = TClock::now();
        bool first = true;
        unsigned prevId = 0;

        while (!Timers_.empty() && Timers_.top().Deadline <= now) {
            TTimer timer = Timers_.top(); Timers_.pop();

            if ((first || prevId != timer.Id) && timer.Handle) { // skip removed timers
                LastFiredTimer_ = timer.Id;
                timer.Handle.resume();
            }

            first = false;
            prevId = timer.Id;
        }

        LastTimersProcessTime_ = now;
    }

    unsigned TimerId_ = 0;
    std::priority_queue<TTimer> Timers_;
    TTime LastTimersProcessTime_;
    unsigned LastFiredTimer_ = (unsigned)(-1);
    std::chrono::milliseconds MaxDuration_ = std::chrono::milliseconds(100);
    timespec MaxDurationTs_ = GetMaxDuration(MaxDuration_);
};

} // namespace NActorRt
