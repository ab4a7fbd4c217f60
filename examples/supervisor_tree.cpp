#include <chrono>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

#include <actorrt/all.hpp>

using namespace NActorRt;
using namespace NActorRt::NActors;

struct TJob {
    static constexpr TMessageId MessageId = 400;
    int Id = 0;
    bool Poison = false;
};

struct TJobDone {
    static constexpr TMessageId MessageId = 401;
    int Id = 0;
    std::string Worker;
};

struct TGetTotal {
    static constexpr TMessageId MessageId = 402;
    TReplyChannel<int> Reply;
};

class TWorker : public TBehaviorActor<TWorker, TJob> {
public:
    TFuture<void> Receive(const TJob& job, TActorContext& ctx) {
        if (job.Poison) {
            throw std::runtime_error("poisoned job " + std::to_string(job.Id));
        }
        co_await ctx.Sleep(std::chrono::milliseconds(5));
        ctx.Publish("jobs.done", TJobDone{job.Id, ctx.Self().Name()});
    }

    EErrorAction OnError(const std::exception_ptr&, TActorContext&) override {
        return EErrorAction::Escalate;
    }
};

class TAccountant : public TBehaviorActor<TAccountant, TJobDone, TGetTotal> {
public:
    TFuture<void> PreStart(TActorContext& ctx) override {
        ctx.Subscribe("jobs.done");
        co_return;
    }

    void Receive(const TJobDone& done, TActorContext& ctx) {
        ++Total_;
        ctx.Log().Debug() << "job " << done.Id << " done by " << done.Worker;
    }

    void Receive(const TGetTotal& request, TActorContext&) {
        request.Reply.Reply(Total_);
    }

private:
    int Total_ = 0;
};

struct TOptions {
    int Jobs = 100;
    int PoisonEvery = 25;
    int Workers = 3;
};

TVoidTask Drive(TLoop<TDefaultPoller>* loop, TActorSystem* system, TOptions options) {
    try {
        auto& app = system->CreateSupervisor("app", TSupervisorConfig{
            .Strategy = ERestartStrategy::OneForOne,
            .Budget = {.MaxRestarts = 10, .BaseDelay = std::chrono::milliseconds(10)}
        });

        auto accountant = co_await app.StartChild(TChildSpec::Actor<TAccountant>("accountant"));
        for (int i = 1; i <= options.Workers; ++i) {
            co_await app.StartChild(TChildSpec::Actor<TWorker>("worker:" + std::to_string(i)));
        }

        for (int i = 1; i <= options.Jobs; ++i) {
            auto worker = system->Broker().SelectFromPool("app/worker");
            if (!worker) {
                co_await system->Poller()->Sleep(std::chrono::milliseconds(1));
                continue;
            }
            bool poison = options.PoisonEvery > 0 && i % options.PoisonEvery == 0;
            auto result = co_await system->SendAsync(*worker, TJob{i, poison});
            if (!result) {
                std::cerr << "job " << i << " not delivered to " << *worker << ": " << result.error().Message() << "\n";
            }
        }
        co_await system->Poller()->Sleep(std::chrono::milliseconds(100));

        TReplyChannel<int> total(system->Poller());
        auto address = app.ChildAddress(accountant);
        if (address && system->Send(*address, TGetTotal{total})) {
            auto value = co_await total.Receive(DeadlineAfter(std::chrono::seconds(1)));
            std::cout << "Jobs done: " << value.value_or(-1) << " of " << options.Jobs << "\n";
        }

        auto* monitor = dynamic_cast<TInMemoryMonitor*>(&system->Monitor());
        if (monitor) {
            auto snapshot = monitor->Snapshot(0);
            std::cout << "Events: " << snapshot.Total << "\n";
            for (size_t i = 0; i < EventKindCount; ++i) {
                if (snapshot.ByKind[i] > 0) {
                    std::cout << "  " << ToString(static_cast<EEventKind>(i)) << ": " << snapshot.ByKind[i] << "\n";
                }
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
    }

    co_await system->Shutdown();
    loop->Stop();
}

int main(int argc, char** argv) {
    TOptions options;
    ELogLevel level = ELogLevel::Info;

    for (int i = 1; i < argc; ++i) {
        if (!strcmp(argv[i], "--jobs") && i + 1 < argc) {
            options.Jobs = std::stoi(argv[++i]);
        } else if (!strcmp(argv[i], "--poison-every") && i + 1 < argc) {
            options.PoisonEvery = std::stoi(argv[++i]);
        } else if (!strcmp(argv[i], "--workers") && i + 1 < argc) {
            options.Workers = std::stoi(argv[++i]);
        } else if (!strcmp(argv[i], "--verbose")) {
            level = ELogLevel::Debug;
        } else if (!strcmp(argv[i], "--help")) {
            std::cout << "Usage: " << argv[0] << " [--jobs n] [--poison-every n] [--workers n] [--verbose]\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            return -1;
        }
    }

    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller(), {.LogLevel = level});

    Drive(&loop, &system, options);
    loop.Loop();

    if (system.FatalError()) {
        std::cerr << "Fatal: " << DescribeError(system.FatalError()) << "\n";
        return 1;
    }
    return 0;
}
