#include "log.hpp"

#include <iostream>

namespace NActorRt {

std::string_view ToString(ELogLevel level) {
    switch (level) {
    case ELogLevel::Debug: return "debug";
    case ELogLevel::Info: return "info";
    case ELogLevel::Warning: return "warning";
    case ELogLevel::Error: return "error";
    case ELogLevel::None: return "none";
    }
    return "unknown";
}

TLogger::TLogger(ELogLevel level, TSink sink)
    : Level_(level)
    , Sink_(std::move(sink))
{ }

void TLogger::Write(ELogLevel level, std::string_view line) const {
    if (Sink_) {
        Sink_(level, line);
    } else {
        std::cerr << "[" << ToString(level) << "] " << line << "\n";
    }
}

} // namespace NActorRt
