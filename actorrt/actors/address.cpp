#include "address.hpp"

#include <atomic>

namespace NActorRt {
namespace NActors {

namespace {

TActorId NextActorId() {
    static std::atomic<TActorId> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
}

} // namespace

TActorAddress TActorAddress::Named(std::string name) {
    return TActorAddress(NextActorId(), std::move(name));
}

TActorAddress TActorAddress::Anonymous() {
    return TActorAddress(NextActorId(), {});
}

std::string TActorAddress::ToString() const {
    return (IsNamed() ? Name_ : std::string("anonymous")) + "@" + std::to_string(Id_);
}

std::ostream& operator<<(std::ostream& out, const TActorAddress& address) {
    return out << address.ToString();
}

} // namespace NActors
} // namespace NActorRt
