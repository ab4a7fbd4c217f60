#pragma once

#include "base.hpp"
#include "poller.hpp"

namespace NActorRt {

/**
 * @class TPoll
 * @brief Poller that sleeps in ppoll(2) until the earliest timer is due.
 *
 * The runtime performs no I/O of its own, so no descriptors are watched:
 * the wait only bounds how long the loop idles between timer passes.
 */
class TPoll: public TPollerBase {
public:
    void Poll();
};

} // namespace NActorRt
