#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace NActorRt {
namespace NActors {

/// Message type identifier
using TMessageId = uint32_t;

enum class EPriority : uint8_t {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3
};

std::string_view ToString(EPriority priority);

/**
 * @brief Requirements for a message type.
 *
 * A message is a copyable value type with a stable identifier:
 * @code
 * struct TPing {
 *     static constexpr TMessageId MessageId = 100;
 *     static constexpr std::string_view Name = "ping";   // optional
 *     EPriority Priority() const { return EPriority::High; } // optional, Normal otherwise
 *     int Seq = 0;
 * };
 * @endcode
 */
template<typename T>
concept CMessage = std::is_copy_constructible_v<T> && requires {
    { T::MessageId } -> std::convertible_to<TMessageId>;
};

namespace NDetail {

struct TMessageOps {
    void (*Destroy)(void*);
    void* (*Clone)(const void*);
    std::string_view Name;
};

template<typename T>
constexpr bool IsEmptyMessage = std::is_empty_v<T> && std::is_trivially_default_constructible_v<T>;

template<typename T>
std::string_view MessageName() {
    if constexpr (requires { { T::Name } -> std::convertible_to<std::string_view>; }) {
        return T::Name;
    } else {
        return typeid(T).name();
    }
}

template<typename T>
struct TMessageOpsFor {
    static void Destroy(void* ptr) {
        delete static_cast<T*>(ptr);
    }

    static void* Clone(const void* ptr) {
        return ptr ? new T(*static_cast<const T*>(ptr)) : nullptr;
    }

    inline static const TMessageOps Value = {&Destroy, &Clone, MessageName<T>()};
};

inline void NoDestroy(void*) { }

} // namespace NDetail

/**
 * @brief Type-erased, immutable, cloneable message value.
 *
 * The payload is owned through a single heap allocation; message types
 * without data members are not allocated at all. Cloning deep-copies the
 * payload, so two recipients of a broadcast never share an object.
 */
class TMessage {
public:
    TMessage() = default;

    TMessage(TMessage&&) = default;
    TMessage& operator=(TMessage&&) = default;
    TMessage(const TMessage&) = delete;
    TMessage& operator=(const TMessage&) = delete;

    template<typename TValue>
        requires CMessage<std::decay_t<TValue>>
    static TMessage Make(TValue&& value) {
        using T = std::decay_t<TValue>;
        TMessage message;
        message.Ops_ = &NDetail::TMessageOpsFor<T>::Value;
        message.Id_ = static_cast<TMessageId>(T::MessageId);
        if constexpr (requires(const T& m) { { m.Priority() } -> std::convertible_to<EPriority>; }) {
            message.Priority_ = value.Priority();
        }
        if constexpr (!NDetail::IsEmptyMessage<T>) {
            message.Data_ = TData(new T(std::forward<TValue>(value)), &NDetail::TMessageOpsFor<T>::Destroy);
        }
        return message;
    }

    TMessage Clone() const {
        TMessage copy;
        copy.Ops_ = Ops_;
        copy.Id_ = Id_;
        copy.Priority_ = Priority_;
        if (Data_) {
            copy.Data_ = TData(Ops_->Clone(Data_.get()), Ops_->Destroy);
        }
        return copy;
    }

    TMessageId Id() const {
        return Id_;
    }

    std::string_view TypeName() const {
        return Ops_ ? Ops_->Name : std::string_view("empty");
    }

    EPriority Priority() const {
        return Priority_;
    }

    explicit operator bool() const {
        return Ops_ != nullptr;
    }

    template<typename T>
    bool Is() const {
        return Ops_ == &NDetail::TMessageOpsFor<T>::Value;
    }

    /// Payload as T; throws std::bad_cast if the message holds another type.
    template<typename T>
    const T& As() const {
        if (!Is<T>()) {
            throw std::bad_cast();
        }
        if constexpr (NDetail::IsEmptyMessage<T>) {
            static const T empty{};
            return empty;
        } else {
            return *static_cast<const T*>(Data_.get());
        }
    }

private:
    using TData = std::unique_ptr<void, void(*)(void*)>;

    TData Data_{nullptr, &NDetail::NoDestroy};
    const NDetail::TMessageOps* Ops_ = nullptr;
    TMessageId Id_ = 0;
    EPriority Priority_ = EPriority::Normal;
};

} // namespace NActors
} // namespace NActorRt
