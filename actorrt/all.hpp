#pragma once

#include "base.hpp"
#include "poller.hpp"
#include "poll.hpp"
#include "loop.hpp"
#include "promises.hpp"
#include "corochain.hpp"
#include "sync.hpp"
#include "log.hpp"

#include "actors/actorsystem.hpp"
#include "actors/reply.hpp"
#include "supervisor/supervisor.hpp"

namespace NActorRt {

using TDefaultPoller = TPoll;

/**
 * @mainpage Actor runtime
 *
 * @section intro_sec Introduction
 *
 * Actors are isolated units of state that talk only through asynchronous
 * messages. Every actor has a mailbox and an execution loop that handles one
 * message at a time; supervisors restart actors that fail.
 *
 * @section features_sec Key Features
 *
 * - @ref NActors::TMailbox with Block, Drop and Reject backpressure.
 * - @ref NActors::TMessageBroker for point-to-point sends, topics and round-robin pools.
 * - @ref NActors::TActorCell, the lifecycle and the message loop of one actor.
 * - @ref NActors::TSupervisor with one-for-one, one-for-all and rest-for-one strategies,
 *   a restart budget with exponential backoff and periodic health checks.
 * - @ref NActors::TInMemoryMonitor for runtime events.
 *
 * Everything runs on one thread, driven by @ref TLoop:
 *
 * @code{.cpp}
 * TLoop<TDefaultPoller> loop;
 * TActorSystem system(&loop.Poller());
 * auto& root = system.CreateSupervisor("app");
 * auto start = root.StartChild(TChildSpec::Actor<TWorker>("worker"));
 * while (!start.done()) {
 *     loop.Step();
 * }
 * @endcode
 */

} // namespace NActorRt
