#pragma once

#include <cstddef>
#include <utility>
#include <vector>

/**
 * @file queue.hpp
 * @brief Ring buffer backing actor mailboxes and supervisor signal queues.
 *
 * A single vector with power-of-two sizing is used as a circular buffer, so
 * steady-state pushes and pops do not allocate (std::deque allocates and
 * frees chunks as it moves). The buffer doubles when full; capacity limits
 * of bounded mailboxes are enforced by the mailbox, not here.
 *
 * @code
 * TUnboundedVectorQueue<TEnvelope> queue(64);
 * queue.Push(std::move(envelope));
 *
 * TEnvelope next;
 * while (queue.TryPop(next)) {
 *     Handle(std::move(next));
 * }
 * @endcode
 */

namespace NActorRt {
namespace NActors {

template<typename T>
class TUnboundedVectorQueue {
public:
    /**
     * @param capacity Initial capacity, rounded up to a power of two.
     */
    explicit TUnboundedVectorQueue(size_t capacity = 16)
        : Data_(RoundUpToPowerOfTwo(capacity < 2 ? 2 : capacity))
        , LastIndex_(Data_.size() - 1)
    { }

    void Push(T&& item) {
        EnsureCapacity();
        Data_[Tail_] = std::move(item);
        Tail_ = (Tail_ + 1) & LastIndex_;
    }

    /// @note Behavior is undefined if the queue is empty
    T& Front() {
        return Data_[Head_];
    }

    /// Removes the front element and releases what it owns.
    /// @note Behavior is undefined if the queue is empty
    void Pop() {
        Data_[Head_] = T{};
        Head_ = (Head_ + 1) & LastIndex_;
    }

    bool TryPop(T& item) {
        if (Empty()) {
            return false;
        }
        item = std::move(Data_[Head_]);
        Pop();
        return true;
    }

    /// Drops every element, keeping the allocated buffer.
    void Clear() {
        while (!Empty()) {
            Pop();
        }
    }

    size_t Size() const {
        return (Data_.size() + Tail_ - Head_) & LastIndex_;
    }

    bool Empty() const {
        return Head_ == Tail_;
    }

private:
    static size_t RoundUpToPowerOfTwo(size_t value) {
        size_t power = 1;
        while (power < value) {
            power <<= 1;
        }
        return power;
    }

    void EnsureCapacity() {
        if (Size() == Data_.size() - 1) [[unlikely]] {
            std::vector<T> newData(Data_.size() * 2);
            auto size = Size();
            for (size_t i = 0; i < size; ++i) {
                newData[i] = std::move(Data_[(Head_ + i) & LastIndex_]);
            }
            Data_ = std::move(newData);
            Head_ = 0;
            Tail_ = size;
            LastIndex_ = Data_.size() - 1;
        }
    }

    std::vector<T> Data_;
    size_t Head_ = 0;
    size_t Tail_ = 0;
    size_t LastIndex_ = 0;
};

} // namespace NActors
} // namespace NActorRt
