#pragma once

#include <cstddef>
#include <exception>
#include <expected>
#include <stdexcept>
#include <string>

#include "address.hpp"

namespace NActorRt {
namespace NActors {

enum class ESendError {
    AddressNotFound,
    MailboxFull,    // bounded mailbox with Reject policy
    MailboxClosed,  // recipient is stopping or stopped
    WouldBlock      // Block policy, full mailbox, caller cannot suspend
};

std::string_view ToString(ESendError error);

/**
 * @brief Why a message was not accepted by the recipient's mailbox.
 *
 * Returned synchronously by every send path; a send never throws for
 * delivery reasons.
 */
struct TSendError {
    ESendError Code;
    TActorAddress Target;
    size_t Capacity = 0;

    std::string Message() const;
};

using TSendResult = std::expected<void, TSendError>;

/// Base of the runtime's exceptions.
class TActorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Pre-start hook failed or did not finish within the start timeout.
class TStartError : public TActorError {
public:
    TStartError(const std::string& what, bool timedOut = false)
        : TActorError(what)
        , TimedOut_(timedOut)
    { }

    bool TimedOut() const {
        return TimedOut_;
    }

private:
    bool TimedOut_;
};

/// Post-stop hook failed or timed out. Reported, never blocks teardown.
class TShutdownError : public TActorError {
public:
    using TActorError::TActorError;
};

/// Restart budget exhausted, or escalation with nobody to escalate to.
class TSupervisionError : public TActorError {
public:
    using TActorError::TActorError;
};

/// Address already registered, actor limit reached, or system shutting down.
class TRegistrationError : public TActorError {
public:
    using TActorError::TActorError;
};

/// what() of the stored exception, or a placeholder for non-std exceptions.
std::string DescribeError(const std::exception_ptr& error);

} // namespace NActors
} // namespace NActorRt
