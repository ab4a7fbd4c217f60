#include "child.hpp"

#include <actorrt/actors/actorsystem.hpp>

#include <stdexcept>

namespace NActorRt {
namespace NActors {

TChildSpec TChildSpec::FromFactory(std::string id, TActorFactory factory) {
    if (!factory) {
        throw std::invalid_argument("child " + id + ": empty actor factory");
    }
    TChildSpec spec;
    spec.Id = std::move(id);
    spec.Factory = [factory = std::move(factory)](const TChildEnv& env) -> IChild::TPtr {
        return std::make_unique<TActorChild>(env, factory);
    };
    return spec;
}

void TChildSpec::Validate() const {
    if (Id.empty()) {
        throw std::invalid_argument("child spec without id");
    }
    if (!Factory) {
        throw std::invalid_argument("child " + Id + ": no factory");
    }
    if (StartTimeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("child " + Id + ": start timeout must be positive");
    }
}

TActorChild::TActorChild(const TChildEnv& env, TActorFactory factory)
    : System_(env.System)
    , Address_(env.Address)
    , MailboxConfig_(env.Spec->Mailbox.value_or(env.System->Config().DefaultMailbox))
    , Factory_(std::move(factory))
{
    Options_.StartTimeout = env.Spec->StartTimeout;
    Options_.ShutdownTimeout = env.Spec->ShutdownTimeout;
    Options_.Supervised = true;
}

TFuture<void> TActorChild::Start() {
    if (Cell_) {
        throw TStartError(Address_.ToString() + ": already started");
    }

    IActor::TPtr actor;
    std::shared_ptr<TMailbox> mailbox;
    try {
        actor = Factory_();
        mailbox = System_->Broker().Register(Address_, MailboxConfig_);
    } catch (const std::exception& ex) {
        throw TStartError(Address_.ToString() + ": " + ex.what());
    }
    if (!actor) {
        System_->Broker().Unregister(Address_);
        throw TStartError(Address_.ToString() + ": factory returned no actor");
    }

    Cell_ = std::make_unique<TActorCell>(System_, Address_, std::move(mailbox), std::move(actor), Options_);
    Cell_->SetObserver(this);
    co_await Cell_->Start();
}

TFuture<void> TActorChild::Stop(TShutdownPolicy policy) {
    if (Cell_) {
        co_await Cell_->Stop(policy);
    }
}

TFuture<THealth> TActorChild::HealthCheck() {
    if (!Cell_) {
        co_return THealth::Failed(Address_.ToString() + " is not started");
    }
    co_return co_await Cell_->HealthCheck();
}

bool TActorChild::Running() const {
    return Cell_ && Cell_->Running();
}

bool TActorChild::Finished() const {
    return !Cell_ || Cell_->Finished();
}

void TActorChild::OnActorExit(TActorCell&, const TActorExit& exit) {
    ReportExit(exit);
}

} // namespace NActors
} // namespace NActorRt
