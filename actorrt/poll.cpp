#include "poll.hpp"

#include <cerrno>
#include <system_error>

#include <poll.h>

namespace {

#if defined(__APPLE__) || defined(__FreeBSD__)
int ppoll(struct pollfd* fds, nfds_t nfds, const struct timespec* ts, const sigset_t* /*sigmask*/) {
    int timeout = 0;
    if (ts) {
        timeout  = ts->tv_sec * 1000;
        timeout += ts->tv_nsec / 1000000;
    }
    return poll(fds, nfds, timeout);
}
#endif

} // namespace

namespace NActorRt {

void TPoll::Poll() {
    auto ts = GetTimeout();

    if (ts.tv_sec != 0 || ts.tv_nsec != 0) {
        if (ppoll(nullptr, 0, &ts, nullptr) < 0 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "poll");
        }
    }

    ProcessTimers();
}

} // namespace NActorRt
