#pragma once

namespace NActorRt {

/**
 * @class TLoop
 * @brief Event loop wrapper around a poller.
 *
 * ### Example Usage
 * @code{.cpp}
 * TLoop<TDefaultPoller> loop;
 * TActorSystem system(&loop.Poller());
 * system.Spawn<TMyActor>();
 * loop.Loop(); // until loop.Stop()
 * @endcode
 *
 * @tparam TPoller A type that provides Poll().
 */
template<typename TPoller>
class TLoop {
public:
    /**
     * @brief Runs the main loop until @ref Stop() is called.
     */
    void Loop() {
        while (Running_) {
            Step();
        }
    }

    void Stop() {
        Running_ = false;
    }

    bool Running() const {
        return Running_;
    }

    /**
     * @brief Waits for the earliest timer and resumes everything that is due.
     */
    void Step() {
        Poller_.Poll();
    }

    TPoller& Poller() {
        return Poller_;
    }

private:
    TPoller Poller_;
    bool Running_ = true;
};

} // namespace NActorRt
