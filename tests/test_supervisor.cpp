#include <algorithm>
#include <chrono>
#include <exception>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <stdarg.h>
#include <stddef.h>
#include <setjmp.h>
#include <unordered_set>

#include <actorrt/all.hpp>

#include "testlib.h"

extern "C" {
#include <cmocka.h>
}

using namespace NActorRt;
using namespace NActorRt::NActors;

struct TCrash {
    static constexpr TMessageId MessageId = 500;
};

struct TQuit {
    static constexpr TMessageId MessageId = 501;
};

struct TSlow {
    static constexpr TMessageId MessageId = 502;
    std::chrono::milliseconds Duration{0};
};

struct TBump {
    static constexpr TMessageId MessageId = 503;
    int Value = 0;
};

struct TLeave {
    static constexpr TMessageId MessageId = 504;
};

struct TWorkerLog {
    std::map<std::string, int> Starts;
    std::map<std::string, int> Stops;
    std::vector<std::string> Events;
    std::set<std::string> FailStart;
    std::set<std::string> Sick;
    std::set<std::string> Busy;
    std::set<std::string> Finished;
    std::map<std::string, std::chrono::milliseconds> StartDelay;
    std::map<std::string, int> Sums;
    std::map<std::string, int> HealthChecks;
    int ChecksDuringHandler = 0;
};

class TWorker : public TBehaviorActor<TWorker, TCrash, TQuit, TSlow> {
public:
    TWorker(std::string name, TWorkerLog* log)
        : Name_(std::move(name))
        , Log_(log)
    { }

    TFuture<void> PreStart(TActorContext& ctx) override {
        if (Log_->FailStart.contains(Name_)) {
            throw std::runtime_error(Name_ + " refuses to start");
        }
        if (auto it = Log_->StartDelay.find(Name_); it != Log_->StartDelay.end()) {
            co_await ctx.Sleep(it->second);
        }
        Log_->Starts[Name_]++;
        Log_->Events.push_back("start:" + Name_);
        co_return;
    }

    TFuture<void> PostStop(TActorContext&) override {
        Log_->Stops[Name_]++;
        Log_->Events.push_back("stop:" + Name_);
        co_return;
    }

    EErrorAction OnError(const std::exception_ptr&, TActorContext&) override {
        return EErrorAction::Escalate;
    }

    TFuture<THealth> HealthCheck(TActorContext&) override {
        Log_->HealthChecks[Name_]++;
        if (Log_->Busy.contains(Name_) && !Log_->Finished.contains(Name_)) {
            Log_->ChecksDuringHandler++;
        }
        // only the first instance is sick
        if (Log_->Sick.contains(Name_) && Log_->Starts[Name_] == 1) {
            co_return THealth::Failed(Name_ + " is sick");
        }
        co_return THealth::Healthy();
    }

    void Receive(const TCrash&, TActorContext&) {
        throw std::runtime_error(Name_ + " crashed");
    }

    void Receive(const TQuit&, TActorContext& ctx) {
        ctx.Stop();
    }

    TFuture<void> Receive(const TSlow& message, TActorContext& ctx) {
        Log_->Busy.insert(Name_);
        co_await ctx.Sleep(message.Duration);
        Log_->Finished.insert(Name_);
    }

private:
    std::string Name_;
    TWorkerLog* Log_;
};

// Keeps a running sum; asks for its own restart on failure.
class TTally : public TBehaviorActor<TTally, TBump, TCrash> {
public:
    TTally(std::string name, TWorkerLog* log)
        : Name_(std::move(name))
        , Log_(log)
    { }

    TFuture<void> PreStart(TActorContext&) override {
        Log_->Starts[Name_]++;
        co_return;
    }

    EErrorAction OnError(const std::exception_ptr&, TActorContext&) override {
        return EErrorAction::Restart;
    }

    void Receive(const TBump& bump, TActorContext&) {
        Sum_ += bump.Value;
        Log_->Sums[Name_] = Sum_;
    }

    void Receive(const TCrash&, TActorContext&) {
        throw std::runtime_error(Name_ + " crashed");
    }

private:
    std::string Name_;
    TWorkerLog* Log_;
    int Sum_ = 0;
};

// Removes itself from its supervisor.
class TLeaver : public TBehaviorActor<TLeaver, TLeave> {
public:
    TLeaver(TSupervisor* supervisor, TWorkerLog* log)
        : Supervisor_(supervisor)
        , Log_(log)
    { }

    TFuture<void> PostStop(TActorContext&) override {
        Log_->Stops["leaver"]++;
        co_return;
    }

    TFuture<void> Receive(const TLeave&, TActorContext&) {
        auto id = Supervisor_->FindChild("leaver");
        co_await Supervisor_->StopChild(*id);
        Log_->Events.push_back("left");
    }

private:
    TSupervisor* Supervisor_;
    TWorkerLog* Log_;
};

TChildSpec worker(const std::string& name, TWorkerLog* log, ERestartPolicy policy = ERestartPolicy::Permanent) {
    auto spec = TChildSpec::Actor<TWorker>(name, name, log);
    spec.RestartPolicy = policy;
    return spec;
}

TSupervisorConfig fast_config(ERestartStrategy strategy, uint32_t maxRestarts = 5) {
    TSupervisorConfig config;
    config.Strategy = strategy;
    config.Budget.MaxRestarts = maxRestarts;
    config.Budget.BaseDelay = std::chrono::milliseconds(0);
    return config;
}

template<typename T>
T wait_for(TLoop<TDefaultPoller>& loop, TFuture<T> future) {
    assert_true(run_until(loop, [&] { return future.done(); }));
    return future.await_resume();
}

void crash(TActorSystem& system, TSupervisor& supervisor, TChildId id) {
    auto address = supervisor.ChildAddress(id);
    assert_true(address.has_value());
    assert_true(system.Send(*address, TCrash{}).has_value());
}

std::vector<std::string> tail(const std::vector<std::string>& events, size_t count) {
    assert_true(events.size() >= count);
    return {events.end() - count, events.end()};
}

void test_restart_policy_table(void**) {
    assert_true(ShouldRestart(ERestartPolicy::Permanent, false));
    assert_true(ShouldRestart(ERestartPolicy::Permanent, true));
    assert_false(ShouldRestart(ERestartPolicy::Transient, false));
    assert_true(ShouldRestart(ERestartPolicy::Transient, true));
    assert_false(ShouldRestart(ERestartPolicy::Temporary, false));
    assert_false(ShouldRestart(ERestartPolicy::Temporary, true));
}

void test_shutdown_policy(void**) {
    auto graceful = TShutdownPolicy::Graceful(std::chrono::milliseconds(250));
    assert_true(graceful.Kind() == TShutdownPolicy::EKind::Graceful);
    assert_true(graceful.Timeout() == std::chrono::milliseconds(250));
    assert_true(graceful.Deadline() > TClock::now());

    assert_true(TShutdownPolicy::Immediate().Timeout() == std::chrono::milliseconds(0));
    assert_false(TShutdownPolicy::Infinity().Timeout().has_value());
    assert_true(TShutdownPolicy::Infinity().Deadline() == Never);
    assert_true(graceful == TShutdownPolicy::Graceful(std::chrono::milliseconds(250)));
    assert_false(graceful == TShutdownPolicy::Immediate());
}

void test_restart_backoff(void**) {
    TRestartBackoff backoff({
        .MaxRestarts = 3,
        .Window = std::chrono::seconds(1),
        .BaseDelay = std::chrono::milliseconds(100),
        .MaxDelay = std::chrono::milliseconds(300)
    });
    auto now = TClock::now();

    assert_false(backoff.IsLimitExceeded(now));
    assert_int_equal(backoff.NextDelay(now).count(), 100);
    backoff.RecordRestart(now);
    assert_int_equal(backoff.NextDelay(now).count(), 200);
    backoff.RecordRestart(now);
    assert_int_equal(backoff.NextDelay(now).count(), 300);
    backoff.RecordRestart(now);
    assert_true(backoff.IsLimitExceeded(now));
    assert_int_equal(backoff.RestartCount(now), 3);

    auto later = now + std::chrono::seconds(2);
    assert_false(backoff.IsLimitExceeded(later));
    assert_int_equal(backoff.RestartCount(later), 0);
    assert_int_equal(backoff.NextDelay(later).count(), 100);
}

void test_restart_budget_validation(void**) {
    TRestartBudget budget;
    budget.BaseDelay = std::chrono::seconds(2);
    budget.MaxDelay = std::chrono::seconds(1);
    bool thrown = false;
    try {
        budget.Validate();
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert_true(thrown);
}

void test_health_verdicts(void**) {
    THealthMonitor monitor({.Enabled = true, .FailureThreshold = 2});

    assert_true(monitor.Record(1, THealth::Failed("down")) == EHealthVerdict::Failing);
    assert_int_equal(monitor.ConsecutiveFailures(1), 1);
    assert_true(monitor.Record(1, THealth::Degraded("slow")) == EHealthVerdict::Degraded);
    assert_int_equal(monitor.ConsecutiveFailures(1), 1);
    assert_true(monitor.Record(1, THealth::Failed("down")) == EHealthVerdict::Restart);
    assert_int_equal(monitor.ConsecutiveFailures(1), 0);

    assert_true(monitor.Record(2, THealth::Failed("down")) == EHealthVerdict::Failing);
    assert_true(monitor.Record(2, THealth::Healthy()) == EHealthVerdict::Healthy);
    assert_int_equal(monitor.ConsecutiveFailures(2), 0);
}

void test_one_for_one(void**) {
    TLoop<TDefaultPoller> loop;
    auto monitor = std::make_shared<TInMemoryMonitor>();
    TActorSystem system(&loop.Poller(), {.Monitor = monitor});
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root", fast_config(ERestartStrategy::OneForOne));
    auto a = wait_for(loop, root.StartChild(worker("a", &log)));
    auto b = wait_for(loop, root.StartChild(worker("b", &log)));
    auto c = wait_for(loop, root.StartChild(worker("c", &log)));
    assert_int_equal(system.ActorsSize(), 3);

    auto address = root.ChildAddress(b);
    crash(system, root, b);
    assert_true(run_until(loop, [&] { return log.Starts["b"] == 2; }));

    assert_int_equal(log.Starts["a"], 1);
    assert_int_equal(log.Starts["c"], 1);
    assert_int_equal(root.ChildRestartCount(b), 1);
    assert_int_equal(root.ChildRestartCount(a), 0);
    assert_true(root.ChildState(b) == EChildState::Running);
    assert_true(root.ChildAddress(b) == address);
    assert_true(system.Broker().IsRegistered(*address));
    assert_int_equal(monitor->Count(EEventKind::ChildFailed), 1);
    assert_int_equal(monitor->Count(EEventKind::ChildRestarted), 1);
    assert_int_equal(root.Backoff().RestartCount(), 1);
    assert_true(root.ChildState(c) == EChildState::Running);

    auto shutdown = system.Shutdown();
    assert_true(run_until(loop, [&] { return shutdown.done(); }));
    assert_true(root.State() == ESupervisorState::Stopped);
    assert_int_equal(system.ActorsSize(), 0);
}

void test_one_for_all(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root", fast_config(ERestartStrategy::OneForAll));
    wait_for(loop, root.StartChild(worker("a", &log)));
    auto b = wait_for(loop, root.StartChild(worker("b", &log)));
    wait_for(loop, root.StartChild(worker("c", &log)));

    crash(system, root, b);
    assert_true(run_until(loop, [&] { return log.Starts["c"] == 2; }));

    assert_int_equal(log.Starts["a"], 2);
    assert_int_equal(log.Starts["b"], 2);
    auto expected = std::vector<std::string>{"stop:b", "stop:c", "stop:a", "start:a", "start:b", "start:c"};
    assert_true(tail(log.Events, 6) == expected);
    assert_int_equal(root.Backoff().RestartCount(), 1);
}

void test_rest_for_one(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root", fast_config(ERestartStrategy::RestForOne));
    wait_for(loop, root.StartChild(worker("a", &log)));
    auto b = wait_for(loop, root.StartChild(worker("b", &log)));
    wait_for(loop, root.StartChild(worker("c", &log)));

    crash(system, root, b);
    assert_true(run_until(loop, [&] { return log.Starts["c"] == 2; }));

    assert_int_equal(log.Starts["a"], 1);
    assert_int_equal(log.Starts["b"], 2);
    auto expected = std::vector<std::string>{"stop:b", "stop:c", "start:b", "start:c"};
    assert_true(tail(log.Events, 4) == expected);
}

void test_transient_and_temporary(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root", fast_config(ERestartStrategy::OneForOne));
    auto transient = wait_for(loop, root.StartChild(worker("transient", &log, ERestartPolicy::Transient)));
    auto temporary = wait_for(loop, root.StartChild(worker("temporary", &log, ERestartPolicy::Temporary)));
    auto quitter = wait_for(loop, root.StartChild(worker("quitter", &log, ERestartPolicy::Transient)));

    // abnormal exit: transient children are restarted
    crash(system, root, transient);
    assert_true(run_until(loop, [&] { return log.Starts["transient"] == 2; }));

    // normal exit: not restarted, forgotten
    assert_true(system.Send(*root.ChildAddress(quitter), TQuit{}).has_value());
    assert_true(run_until(loop, [&] { return !root.ChildState(quitter).has_value(); }));
    assert_int_equal(log.Starts["quitter"], 1);

    crash(system, root, temporary);
    assert_true(run_until(loop, [&] { return !root.ChildState(temporary).has_value(); }));
    assert_int_equal(log.Starts["temporary"], 1);
    assert_int_equal(root.ChildCount(), 1);
}

void test_temporary_sibling_removed(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root", fast_config(ERestartStrategy::OneForAll));
    auto a = wait_for(loop, root.StartChild(worker("a", &log)));
    wait_for(loop, root.StartChild(worker("t", &log, ERestartPolicy::Temporary)));

    crash(system, root, a);
    assert_true(run_until(loop, [&] { return log.Starts["a"] == 2; }));
    assert_int_equal(root.ChildCount(), 1);
    assert_int_equal(log.Starts["t"], 1);
    assert_int_equal(log.Stops["t"], 1);
}

void test_restart_budget_exhausted(void**) {
    TLoop<TDefaultPoller> loop;
    auto monitor = std::make_shared<TInMemoryMonitor>();
    int fatal = 0;
    TActorSystem system(&loop.Poller(), {
        .Monitor = monitor,
        .OnFatalError = [&fatal](const std::exception_ptr&) { fatal++; }
    });
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root", fast_config(ERestartStrategy::OneForOne, 2));
    auto a = wait_for(loop, root.StartChild(worker("a", &log)));
    wait_for(loop, root.StartChild(worker("b", &log)));

    for (int restarts = 1; restarts <= 2; ++restarts) {
        crash(system, root, a);
        assert_true(run_until(loop, [&] { return log.Starts["a"] == restarts + 1; }));
    }

    crash(system, root, a);
    assert_true(run_until(loop, [&] { return root.State() == ESupervisorState::Failed; }));

    assert_int_equal(log.Starts["a"], 3);
    assert_int_equal(log.Stops["b"], 1);
    assert_int_equal(system.ActorsSize(), 0);
    assert_int_equal(fatal, 1);
    assert_int_equal(monitor->Count(EEventKind::RestartLimitExceeded), 1);
    assert_int_equal(monitor->Count(EEventKind::FatalError), 1);

    bool supervision = false;
    try {
        std::rethrow_exception(system.FatalError());
    } catch (const TSupervisionError& ex) {
        supervision = std::string(ex.what()).find("restart limit exceeded") != std::string::npos;
    }
    assert_true(supervision);
}

void test_nested_escalation(void**) {
    TLoop<TDefaultPoller> loop;
    auto monitor = std::make_shared<TInMemoryMonitor>();
    TActorSystem system(&loop.Poller(), {.Monitor = monitor});
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root", fast_config(ERestartStrategy::OneForOne));
    auto inner = wait_for(loop, root.StartChild(TChildSpec::Supervisor(
        "inner", fast_config(ERestartStrategy::OneForOne, 1), {worker("x", &log)})));
    assert_int_equal(log.Starts["x"], 1);

    auto x = system.Broker().Resolve("root/inner/x");
    assert_true(x.has_value());
    assert_true(system.Send(*x, TCrash{}).has_value());
    assert_true(run_until(loop, [&] { return log.Starts["x"] == 2; }));

    // second crash exhausts the inner budget; the root restarts the whole subtree
    x = system.Broker().Resolve("root/inner/x");
    assert_true(system.Send(*x, TCrash{}).has_value());
    assert_true(run_until(loop, [&] { return log.Starts["x"] == 3; }));

    assert_int_equal(monitor->Count(EEventKind::RestartLimitExceeded), 1);
    assert_int_equal(monitor->Count(EEventKind::Escalated), 1);
    assert_int_equal(root.ChildRestartCount(inner), 1);
    assert_true(root.State() == ESupervisorState::Running);
    assert_true(root.ChildState(inner) == EChildState::Running);
    assert_true(system.FatalError() == nullptr);

    auto* nested = dynamic_cast<TSupervisor*>(root.ChildInstance(inner));
    assert_non_null(nested);
    assert_true(nested->Name() == "root/inner");
    assert_int_equal(nested->ChildCount(), 1);

    auto shutdown = system.Shutdown();
    assert_true(run_until(loop, [&] { return shutdown.done(); }));
    assert_int_equal(system.ActorsSize(), 0);
}

void test_health_restart(void**) {
    TLoop<TDefaultPoller> loop;
    auto monitor = std::make_shared<TInMemoryMonitor>();
    TActorSystem system(&loop.Poller(), {.Monitor = monitor});
    TWorkerLog log;
    log.Sick.insert("h");

    auto config = fast_config(ERestartStrategy::OneForOne);
    config.Health.Enabled = true;
    config.Health.Interval = std::chrono::milliseconds(10);
    config.Health.Timeout = std::chrono::milliseconds(50);
    config.Health.FailureThreshold = 2;

    auto& root = system.CreateSupervisor("root", config);
    auto h = wait_for(loop, root.StartChild(worker("h", &log)));
    wait_for(loop, root.StartChild(worker("ok", &log)));

    assert_true(run_until(loop, [&] { return log.Starts["h"] == 2; }, std::chrono::seconds(2)));
    assert_int_equal(log.Stops["h"], 1);
    assert_int_equal(log.Starts["ok"], 1);
    assert_true(monitor->Count(EEventKind::HealthFailed) >= 2);
    assert_int_equal(monitor->Count(EEventKind::ChildFailed), 1);

    auto health = wait_for(loop, root.CheckChildHealth(h));
    assert_true(health.has_value());
    assert_true(health->IsHealthy());
    assert_false(wait_for(loop, root.CheckChildHealth(999)).has_value());

    auto overall = wait_for(loop, root.HealthCheck());
    assert_true(overall.IsHealthy());
}

void test_shutdown_graceful_timeout(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root");
    auto spec = worker("slow", &log);
    spec.Shutdown = TShutdownPolicy::Graceful(std::chrono::milliseconds(20));
    auto id = wait_for(loop, root.StartChild(std::move(spec)));

    assert_true(system.Send(*root.ChildAddress(id), TSlow{std::chrono::seconds(10)}).has_value());
    assert_true(run_until(loop, [&] { return log.Busy.contains("slow"); }));

    auto stopped = root.StopChild(id);
    assert_true(run_until(loop, [&] { return stopped.done(); }, std::chrono::seconds(2)));
    assert_true(stopped.await_resume());
    assert_false(log.Finished.contains("slow"));
    assert_int_equal(log.Stops["slow"], 1);
    assert_int_equal(root.ChildCount(), 0);
    assert_int_equal(system.ActorsSize(), 0);
}

void test_shutdown_graceful_completes(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root");
    auto spec = worker("slow", &log);
    spec.Shutdown = TShutdownPolicy::Graceful(std::chrono::seconds(1));
    auto id = wait_for(loop, root.StartChild(std::move(spec)));

    assert_true(system.Send(*root.ChildAddress(id), TSlow{std::chrono::milliseconds(20)}).has_value());
    assert_true(run_until(loop, [&] { return log.Busy.contains("slow"); }));

    assert_true(wait_for(loop, root.StopChild(id)));
    assert_true(log.Finished.contains("slow"));
    assert_int_equal(log.Stops["slow"], 1);
    assert_false(wait_for(loop, root.StopChild(id)));
}

void test_shutdown_infinity(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root");
    auto spec = worker("slow", &log);
    spec.Shutdown = TShutdownPolicy::Infinity();
    auto id = wait_for(loop, root.StartChild(std::move(spec)));

    assert_true(system.Send(*root.ChildAddress(id), TSlow{std::chrono::milliseconds(50)}).has_value());
    assert_true(run_until(loop, [&] { return log.Busy.contains("slow"); }));

    assert_true(wait_for(loop, root.StopChild(id)));
    assert_true(log.Finished.contains("slow"));
}

void test_shutdown_immediate(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root");
    auto id = wait_for(loop, root.StartChild(worker("slow", &log)));
    wait_for(loop, root.StartChild(worker("idle", &log)));

    assert_true(system.Send(*root.ChildAddress(id), TSlow{std::chrono::seconds(10)}).has_value());
    assert_true(run_until(loop, [&] { return log.Busy.contains("slow"); }));

    auto stopped = root.Stop(TShutdownPolicy::Immediate());
    assert_true(run_until(loop, [&] { return stopped.done(); }, std::chrono::seconds(1)));
    assert_true(root.State() == ESupervisorState::Stopped);
    assert_false(log.Finished.contains("slow"));
    // reverse registration order
    auto expected = std::vector<std::string>{"stop:idle", "stop:slow"};
    assert_true(tail(log.Events, 2) == expected);
    assert_int_equal(system.ActorsSize(), 0);
}

void test_start_child_failure(void**) {
    TLoop<TDefaultPoller> loop;
    auto monitor = std::make_shared<TInMemoryMonitor>();
    TActorSystem system(&loop.Poller(), {.Monitor = monitor});
    TWorkerLog log;
    log.FailStart.insert("bad");

    auto& root = system.CreateSupervisor("root");
    wait_for(loop, root.StartChild(worker("a", &log)));

    auto failing = root.StartChild(worker("bad", &log));
    assert_true(run_until(loop, [&] { return failing.done(); }));
    bool startError = false;
    try {
        failing.await_resume();
    } catch (const TStartError& ex) {
        startError = std::string(ex.what()).find("refuses to start") != std::string::npos;
    }
    assert_true(startError);
    assert_int_equal(root.ChildCount(), 1);
    assert_false(root.FindChild("bad").has_value());
    assert_true(monitor->Count(EEventKind::StartFailed) >= 1);

    auto duplicate = root.StartChild(worker("a", &log));
    assert_true(run_until(loop, [&] { return duplicate.done(); }));
    bool invalid = false;
    try {
        duplicate.await_resume();
    } catch (const std::invalid_argument&) {
        invalid = true;
    }
    assert_true(invalid);
    assert_int_equal(log.Starts["a"], 1);
}

void test_initial_children_rollback(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;
    log.FailStart.insert("bad");

    TSupervisor supervisor(&system, "manual", fast_config(ERestartStrategy::OneForOne),
        {worker("a", &log), worker("bad", &log), worker("never", &log)});

    auto start = supervisor.Start();
    assert_true(run_until(loop, [&] { return start.done(); }));
    bool thrown = false;
    try {
        start.await_resume();
    } catch (const TStartError&) {
        thrown = true;
    }
    assert_true(thrown);
    assert_true(supervisor.State() == ESupervisorState::Stopped);
    assert_int_equal(log.Stops["a"], 1);
    assert_int_equal(log.Starts["never"], 0);
    assert_int_equal(system.ActorsSize(), 0);
}

void test_manual_restart(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root");
    auto id = wait_for(loop, root.StartChild(worker("a", &log)));

    assert_true(wait_for(loop, root.RestartChild(id)));
    assert_int_equal(log.Starts["a"], 2);
    assert_int_equal(log.Stops["a"], 1);
    assert_int_equal(root.ChildRestartCount(id), 1);
    assert_int_equal(root.Backoff().RestartCount(), 0);
    assert_false(wait_for(loop, root.RestartChild(999)));
}

void test_spawn_supervised(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;

    auto address = wait_for(loop, system.SpawnSupervised(worker("w", &log), fast_config(ERestartStrategy::OneForOne)));
    assert_true(address.Name() == "supervisor-1/w");

    assert_true(system.Send(address, TCrash{}).has_value());
    assert_true(run_until(loop, [&] { return log.Starts["w"] == 2; }));
    assert_true(system.Broker().IsRegistered(address));

    auto shutdown = system.Shutdown();
    assert_true(run_until(loop, [&] { return shutdown.done(); }));
    assert_int_equal(log.Stops["w"], 2);
}

void test_restart_decision_isolated(void**) {
    TLoop<TDefaultPoller> loop;
    auto monitor = std::make_shared<TInMemoryMonitor>();
    TActorSystem system(&loop.Poller(), {.Monitor = monitor});
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root", fast_config(ERestartStrategy::OneForOne));
    auto a = wait_for(loop, root.StartChild(TChildSpec::Actor<TTally>("a", std::string("a"), &log)));
    auto b = wait_for(loop, root.StartChild(TChildSpec::Actor<TTally>("b", std::string("b"), &log)));

    auto addressB = *root.ChildAddress(b);
    for (int i = 1; i <= 3; ++i) {
        assert_true(system.Send(addressB, TBump{i}).has_value());
    }
    assert_true(run_until(loop, [&] { return log.Sums["b"] == 6; }));

    auto* childB = dynamic_cast<TActorChild*>(root.ChildInstance(b));
    assert_non_null(childB);
    assert_true(run_until(loop, [&] { return childB->Cell()->Context().MessagesProcessed() == 3; }));

    crash(system, root, a);
    assert_true(run_until(loop, [&] { return log.Starts["a"] == 2; }));

    assert_int_equal(root.ChildRestartCount(a), 1);
    assert_int_equal(root.ChildRestartCount(b), 0);
    assert_int_equal(log.Starts["b"], 1);
    assert_true(root.ChildInstance(b) == childB);
    assert_int_equal(childB->Cell()->Context().MessagesProcessed(), 3);

    // b keeps its sum
    assert_true(system.Send(addressB, TBump{4}).has_value());
    assert_true(run_until(loop, [&] { return log.Sums["b"] == 10; }));

    auto failures = monitor->Events(EEventKind::ChildFailed);
    assert_int_equal(failures.size(), 1);
    assert_true(failures[0].Subject == "a");
    assert_true(failures[0].Detail.find("restart_requested") != std::string::npos);

    auto shutdown = system.Shutdown();
    assert_true(run_until(loop, [&] { return shutdown.done(); }));
}

void test_health_check_waits_for_handler(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;

    auto config = fast_config(ERestartStrategy::OneForOne);
    config.Health.Enabled = true;
    config.Health.Interval = std::chrono::milliseconds(10);
    config.Health.Timeout = std::chrono::seconds(1);
    config.Health.FailureThreshold = 3;

    auto& root = system.CreateSupervisor("root", config);
    auto id = wait_for(loop, root.StartChild(worker("busy", &log)));

    assert_true(system.Send(*root.ChildAddress(id), TSlow{std::chrono::milliseconds(150)}).has_value());
    assert_true(run_until(loop, [&] { return log.Finished.contains("busy"); }, std::chrono::seconds(2)));
    auto checks = log.HealthChecks["busy"];
    assert_true(run_until(loop, [&] { return log.HealthChecks["busy"] > checks + 1; }, std::chrono::seconds(2)));

    assert_int_equal(log.ChecksDuringHandler, 0);
    assert_int_equal(log.Starts["busy"], 1);
}

void test_stop_child_from_own_handler(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;

    auto& root = system.CreateSupervisor("root", fast_config(ERestartStrategy::OneForAll));
    auto spec = TChildSpec::Actor<TLeaver>("leaver", &root, &log);
    spec.Shutdown = TShutdownPolicy::Graceful(std::chrono::milliseconds(50));
    auto leaver = wait_for(loop, root.StartChild(std::move(spec)));
    wait_for(loop, root.StartChild(worker("b", &log)));

    assert_true(system.Send(*root.ChildAddress(leaver), TLeave{}).has_value());
    assert_true(run_until(loop, [&] { return root.ChildCount() == 1; }, std::chrono::seconds(2)));

    assert_false(root.ChildState(leaver).has_value());
    assert_int_equal(log.Stops["leaver"], 1);
    assert_int_equal(log.Starts["b"], 1);
    assert_int_equal(system.ActorsSize(), 1);
    assert_true(std::find(log.Events.begin(), log.Events.end(), "left") == log.Events.end());

    auto shutdown = system.Shutdown();
    assert_true(run_until(loop, [&] { return shutdown.done(); }));
    assert_int_equal(system.ActorsSize(), 0);
}

void test_nested_start_timeout(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;
    log.StartDelay["slow"] = std::chrono::milliseconds(500);

    auto& root = system.CreateSupervisor("root", fast_config(ERestartStrategy::OneForOne));
    auto nested = TChildSpec::Supervisor("nested", fast_config(ERestartStrategy::OneForOne),
        {worker("fast", &log), worker("slow", &log)});
    nested.StartTimeout = std::chrono::milliseconds(50);

    auto start = root.StartChild(std::move(nested));
    assert_true(run_until(loop, [&] { return start.done(); }, std::chrono::seconds(2)));
    bool timedOut = false;
    try {
        start.await_resume();
    } catch (const TStartError& ex) {
        timedOut = ex.TimedOut();
    }
    assert_true(timedOut);
    assert_int_equal(root.ChildCount(), 0);
    assert_int_equal(log.Starts["fast"], 1);
    assert_int_equal(log.Starts["slow"], 0);
    assert_int_equal(system.ActorsSize(), 0);
}

void test_spawn_supervised_disposal(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    TWorkerLog log;
    log.FailStart.insert("broken");

    for (int i = 0; i < 20; ++i) {
        auto address = wait_for(loop, system.SpawnSupervised(
            worker("temp", &log, ERestartPolicy::Temporary), fast_config(ERestartStrategy::OneForOne)));
        assert_true(system.Send(address, TQuit{}).has_value());
        assert_true(run_until(loop, [&] { return system.ActorsSize() == 0 && system.SupervisorsSize() == 0; }));
    }
    assert_int_equal(log.Starts["temp"], 20);

    auto failing = system.SpawnSupervised(worker("broken", &log));
    assert_true(run_until(loop, [&] { return failing.done(); }));
    bool thrown = false;
    try {
        failing.await_resume();
    } catch (const TStartError&) {
        thrown = true;
    }
    assert_true(thrown);
    assert_int_equal(system.SupervisorsSize(), 0);

    // a permanent child keeps its supervisor
    wait_for(loop, system.SpawnSupervised(worker("kept", &log)));
    assert_int_equal(system.SupervisorsSize(), 1);
}

void test_duplicate_supervisor_name(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());

    system.CreateSupervisor("app");
    bool thrown = false;
    try {
        system.CreateSupervisor("app");
    } catch (const TRegistrationError&) {
        thrown = true;
    }
    assert_true(thrown);
    assert_int_equal(system.SupervisorsSize(), 1);

    // generated names skip taken ones
    system.CreateSupervisor("supervisor-1");
    TWorkerLog log;
    auto address = wait_for(loop, system.SpawnSupervised(worker("w", &log)));
    assert_true(address.Name() == "supervisor-2/w");
}

int main(int argc, char** argv) {
    std::vector<CMUnitTest> tests;
    std::unordered_set<std::string> filters;
    tests.reserve(32);

    parse_filters(argc, argv, filters);

    ADD_TEST(cmocka_unit_test, test_restart_policy_table);
    ADD_TEST(cmocka_unit_test, test_shutdown_policy);
    ADD_TEST(cmocka_unit_test, test_restart_backoff);
    ADD_TEST(cmocka_unit_test, test_restart_budget_validation);
    ADD_TEST(cmocka_unit_test, test_health_verdicts);
    ADD_TEST(cmocka_unit_test, test_one_for_one);
    ADD_TEST(cmocka_unit_test, test_one_for_all);
    ADD_TEST(cmocka_unit_test, test_rest_for_one);
    ADD_TEST(cmocka_unit_test, test_transient_and_temporary);
    ADD_TEST(cmocka_unit_test, test_temporary_sibling_removed);
    ADD_TEST(cmocka_unit_test, test_restart_budget_exhausted);
    ADD_TEST(cmocka_unit_test, test_nested_escalation);
    ADD_TEST(cmocka_unit_test, test_health_restart);
    ADD_TEST(cmocka_unit_test, test_shutdown_graceful_timeout);
    ADD_TEST(cmocka_unit_test, test_shutdown_graceful_completes);
    ADD_TEST(cmocka_unit_test, test_shutdown_infinity);
    ADD_TEST(cmocka_unit_test, test_shutdown_immediate);
    ADD_TEST(cmocka_unit_test, test_start_child_failure);
    ADD_TEST(cmocka_unit_test, test_initial_children_rollback);
    ADD_TEST(cmocka_unit_test, test_manual_restart);
    ADD_TEST(cmocka_unit_test, test_spawn_supervised);
    ADD_TEST(cmocka_unit_test, test_restart_decision_isolated);
    ADD_TEST(cmocka_unit_test, test_health_check_waits_for_handler);
    ADD_TEST(cmocka_unit_test, test_stop_child_from_own_handler);
    ADD_TEST(cmocka_unit_test, test_nested_start_timeout);
    ADD_TEST(cmocka_unit_test, test_spawn_supervised_disposal);
    ADD_TEST(cmocka_unit_test, test_duplicate_supervisor_name);

    return _cmocka_run_group_tests("test_supervisor", tests.data(), tests.size(), NULL, NULL);
}
