#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

#include "base.hpp"
#include "corochain.hpp"
#include "poller.hpp"

namespace NActorRt {

/**
 * @class TWaitList
 * @brief FIFO list of suspended coroutines waiting for a condition.
 *
 * Waiters are linked intrusively through their awaiter, which lives in the
 * awaiting coroutine's frame. Notification never resumes a waiter inline: the
 * waiter is scheduled on the poller and resumed on the next timer pass, so the
 * notifier keeps running on its own stack.
 *
 * A waiter whose coroutine is destroyed while suspended (a cancelled future)
 * unlinks itself and cancels any pending timer, so destroying coroutines at
 * arbitrary suspension points is safe. A waiter destroyed after it was
 * notified but before it ran hands the notification to the next waiter.
 *
 * Waits are not condition checks: callers re-test their condition in a loop.
 * @code{.cpp}
 * while (queue.Empty()) {
 *     co_await notEmpty.Wait();
 * }
 * @endcode
 */
class TWaitList {
public:
    struct TWaiter {
        enum class EState : uint8_t {
            Idle,
            Waiting,
            Notified,
            Resumed
        };

        TWaiter* Prev = nullptr;
        TWaiter* Next = nullptr;
        TWaitList* List = nullptr;
        TPollerBase* Poller = nullptr;
        THandle Handle;
        TTime Deadline = Never;
        unsigned DeadlineTimer = 0;
        unsigned ResumeTimer = 0;
        EState State = EState::Idle;
    };

    class TAwaiter {
    public:
        TAwaiter(TWaitList* list, TTime deadline) {
            Node_.List = list;
            Node_.Poller = list->Poller_;
            Node_.Deadline = deadline;
        }

        TAwaiter(const TAwaiter&) = delete;
        TAwaiter& operator=(const TAwaiter&) = delete;

        ~TAwaiter() {
            switch (Node_.State) {
            case TWaiter::EState::Waiting:
                if (Node_.List) {
                    Node_.List->Unlink(&Node_);
                }
                if (Node_.Deadline != Never) {
                    Node_.Poller->RemoveTimer(Node_.DeadlineTimer, Node_.Deadline);
                }
                break;
            case TWaiter::EState::Notified:
                Node_.Poller->CancelResume(Node_.ResumeTimer);
                if (auto* list = Node_.List) {
                    list->Release(&Node_);
                    list->NotifyOne();
                }
                break;
            default:
                break;
            }
        }

        bool await_ready() const noexcept {
            return false;
        }

        void await_suspend(THandle h) {
            Node_.Handle = h;
            Node_.State = TWaiter::EState::Waiting;
            Node_.List->Link(&Node_);
            if (Node_.Deadline != Never) {
                Node_.DeadlineTimer = Node_.Poller->AddTimer(Node_.Deadline, h);
            }
        }

        /// True when notified, false when the deadline passed first.
        bool await_resume() {
            bool notified = Node_.State == TWaiter::EState::Notified;
            if (Node_.List) {
                if (notified) {
                    Node_.List->Release(&Node_);
                } else {
                    Node_.List->Unlink(&Node_);
                }
            }
            Node_.State = TWaiter::EState::Resumed;
            return notified;
        }

    private:
        TWaiter Node_;
    };

    explicit TWaitList(TPollerBase* poller)
        : Poller_(poller)
    { }

    TWaitList(const TWaitList&) = delete;
    TWaitList& operator=(const TWaitList&) = delete;

    ~TWaitList() {
        Detach(Head_);
        Detach(Pending_);
        Head_ = Tail_ = Pending_ = nullptr;
    }

    TAwaiter Wait() {
        return TAwaiter(this, Never);
    }

    TAwaiter WaitUntil(TTime deadline) {
        return TAwaiter(this, deadline);
    }

    /// Schedules the oldest waiter. Returns false if there was none.
    bool NotifyOne() {
        auto* waiter = Head_;
        if (!waiter) {
            return false;
        }
        Unlink(waiter);
        // notified waiters stay reachable until they run
        waiter->List = this;
        waiter->Next = Pending_;
        if (Pending_) {
            Pending_->Prev = waiter;
        }
        Pending_ = waiter;
        waiter->State = TWaiter::EState::Notified;
        if (waiter->Deadline != Never) {
            Poller_->RemoveTimer(waiter->DeadlineTimer, waiter->Deadline);
        }
        waiter->ResumeTimer = Poller_->ScheduleResume(waiter->Handle);
        return true;
    }

    size_t NotifyAll() {
        size_t count = 0;
        while (NotifyOne()) {
            ++count;
        }
        return count;
    }

    bool Empty() const {
        return Head_ == nullptr;
    }

    size_t Size() const {
        return Size_;
    }

    TPollerBase* Poller() const {
        return Poller_;
    }

private:
    void Link(TWaiter* waiter) {
        waiter->Prev = Tail_;
        waiter->Next = nullptr;
        if (Tail_) {
            Tail_->Next = waiter;
        } else {
            Head_ = waiter;
        }
        Tail_ = waiter;
        ++Size_;
    }

    void Unlink(TWaiter* waiter) {
        if (waiter->Prev) {
            waiter->Prev->Next = waiter->Next;
        } else {
            Head_ = waiter->Next;
        }
        if (waiter->Next) {
            waiter->Next->Prev = waiter->Prev;
        } else {
            Tail_ = waiter->Prev;
        }
        waiter->Prev = waiter->Next = nullptr;
        waiter->List = nullptr;
        --Size_;
    }

    void Release(TWaiter* waiter) {
        if (waiter->Prev) {
            waiter->Prev->Next = waiter->Next;
        } else {
            Pending_ = waiter->Next;
        }
        if (waiter->Next) {
            waiter->Next->Prev = waiter->Prev;
        }
        waiter->Prev = waiter->Next = nullptr;
        waiter->List = nullptr;
    }

    static void Detach(TWaiter* waiter) {
        while (waiter) {
            auto* next = waiter->Next;
            waiter->Prev = waiter->Next = nullptr;
            waiter->List = nullptr;
            waiter = next;
        }
    }

    TPollerBase* Poller_;
    TWaiter* Head_ = nullptr;
    TWaiter* Tail_ = nullptr;
    TWaiter* Pending_ = nullptr;
    size_t Size_ = 0;
};

/**
 * @class TAsyncMutex
 * @brief Coroutine mutex; waiters queue on a TWaitList.
 *
 * @code{.cpp}
 * auto guard = co_await mutex.Lock();
 * // exclusive section, may suspend
 * @endcode
 */
class TAsyncMutex {
public:
    class TGuard {
    public:
        TGuard() = default;
        explicit TGuard(TAsyncMutex* mutex)
            : Mutex_(mutex)
        { }
        TGuard(TGuard&& other)
            : Mutex_(std::exchange(other.Mutex_, nullptr))
        { }
        TGuard& operator=(TGuard&& other) {
            if (this != &other) {
                Release();
                Mutex_ = std::exchange(other.Mutex_, nullptr);
            }
            return *this;
        }
        TGuard(const TGuard&) = delete;
        TGuard& operator=(const TGuard&) = delete;

        ~TGuard() {
            Release();
        }

        void Release() {
            if (Mutex_) {
                std::exchange(Mutex_, nullptr)->Unlock();
            }
        }

    private:
        TAsyncMutex* Mutex_ = nullptr;
    };

    explicit TAsyncMutex(TPollerBase* poller)
        : Waiters_(poller)
    { }

    TFuture<TGuard> Lock() {
        while (Locked_) {
            co_await Waiters_.Wait();
        }
        Locked_ = true;
        co_return TGuard(this);
    }

    bool Locked() const {
        return Locked_;
    }

private:
    // every waiter re-checks, so a waiter cancelled after its wakeup cannot strand the rest
    void Unlock() {
        Locked_ = false;
        Waiters_.NotifyAll();
    }

    TWaitList Waiters_;
    bool Locked_ = false;
};

} // namespace NActorRt
