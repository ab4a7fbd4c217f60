#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace NActorRt {
namespace NActors {

/// Process-unique numeric part of an address.
using TActorId = uint64_t;

/**
 * @brief Opaque identifier of an actor, named or anonymous.
 *
 * Every address carries a process-unique id, so two actors spawned with the
 * same name still have distinct addresses. Comparison and hashing use both
 * the id and the name.
 */
class TActorAddress {
public:
    TActorAddress() = default;

    static TActorAddress Named(std::string name);
    static TActorAddress Anonymous();

    TActorId Id() const {
        return Id_;
    }

    const std::string& Name() const {
        return Name_;
    }

    bool IsNamed() const {
        return !Name_.empty();
    }

    /// False for a default constructed address.
    explicit operator bool() const {
        return Id_ != 0;
    }

    /// "name@id" or "anonymous@id".
    std::string ToString() const;

    bool operator==(const TActorAddress& other) const = default;

private:
    TActorAddress(TActorId id, std::string name)
        : Id_(id)
        , Name_(std::move(name))
    { }

    TActorId Id_ = 0;
    std::string Name_;
};

std::ostream& operator<<(std::ostream& out, const TActorAddress& address);

} // namespace NActors
} // namespace NActorRt

template<>
struct std::hash<NActorRt::NActors::TActorAddress> {
    size_t operator()(const NActorRt::NActors::TActorAddress& address) const noexcept {
        return std::hash<uint64_t>{}(address.Id()) ^ (std::hash<std::string>{}(address.Name()) << 1);
    }
};
