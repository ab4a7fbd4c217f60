#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <actorrt/base.hpp>

namespace NActorRt {
namespace NActors {

enum class ESeverity {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

std::string_view ToString(ESeverity severity);

enum class EEventKind {
    ActorSpawned,
    ActorStarted,
    ActorStopped,
    ActorRestarted,
    HandlerFailed,
    StartFailed,
    ShutdownFailed,
    MessageExpired,
    ChildStarted,
    ChildStopped,
    ChildFailed,
    ChildRestarted,
    StrategyApplied,
    RestartLimitExceeded,
    Escalated,
    HealthDegraded,
    HealthFailed,
    FatalError
};

inline constexpr size_t EventKindCount = static_cast<size_t>(EEventKind::FatalError) + 1;

std::string_view ToString(EEventKind kind);
ESeverity SeverityOf(EEventKind kind);

struct TRuntimeEvent {
    EEventKind Kind;
    std::string Source;   ///< actor address or supervisor name
    std::string Subject;  ///< child id, message type; may be empty
    std::string Detail;
    uint32_t RestartCount = 0;
    TTime Timestamp = TClock::now();

    ESeverity Severity() const {
        return SeverityOf(Kind);
    }
};

/// Receives lifecycle, supervision and health events.
class IMonitor {
public:
    virtual ~IMonitor() = default;
    virtual void Record(const TRuntimeEvent& event) = 0;
};

class TNoopMonitor : public IMonitor {
public:
    void Record(const TRuntimeEvent&) override { }
};

/**
 * @brief Keeps counters and a bounded history of events.
 *
 * Safe to read from another thread while the runtime records into it.
 */
class TInMemoryMonitor : public IMonitor {
public:
    struct TSnapshot {
        uint64_t Total = 0;
        std::array<uint64_t, EventKindCount> ByKind{};
        std::array<uint64_t, static_cast<size_t>(ESeverity::Critical) + 1> BySeverity{};
        std::vector<TRuntimeEvent> Recent;
    };

    explicit TInMemoryMonitor(size_t maxHistory = 1000);

    void Record(const TRuntimeEvent& event) override;

    /// Counters and the @p recent latest events, oldest first.
    TSnapshot Snapshot(size_t recent = 10) const;

    uint64_t Count(EEventKind kind) const;
    uint64_t Count(ESeverity severity) const;
    std::vector<TRuntimeEvent> Events(EEventKind kind) const;
    std::vector<TRuntimeEvent> History() const;
    void Reset();

private:
    size_t MaxHistory_;
    mutable std::mutex Mutex_;
    std::deque<TRuntimeEvent> History_;
    TSnapshot Counters_;
};

} // namespace NActors
} // namespace NActorRt
