#include "errors.hpp"

namespace NActorRt {
namespace NActors {

std::string_view ToString(ESendError error) {
    switch (error) {
    case ESendError::AddressNotFound: return "address not found";
    case ESendError::MailboxFull: return "mailbox full";
    case ESendError::MailboxClosed: return "mailbox closed";
    case ESendError::WouldBlock: return "would block";
    }
    return "unknown";
}

std::string TSendError::Message() const {
    std::string message = std::string(ToString(Code)) + ": " + Target.ToString();
    if (Code == ESendError::MailboxFull) {
        message += " (capacity " + std::to_string(Capacity) + ")";
    }
    return message;
}

std::string DescribeError(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& ex) {
        return ex.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace NActors
} // namespace NActorRt
