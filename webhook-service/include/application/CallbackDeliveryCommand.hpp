#pragma once

#include "ports/output/ICallbackDeliveryClient.hpp"
#include "domain/CallbackEnvelope.hpp"
#include <ICommand.hpp>

#include <memory>
#include <string>

namespace jobhook::application {

class CallbackDeliveryCommand : public ICommand {
public:
    CallbackDeliveryCommand(
        std::string callbackUrl,
        domain::CallbackEnvelope envelope,
        std::string secret,
        std::shared_ptr<ports::output::ICallbackDeliveryClient> delivery
    ) : callbackUrl_(std::move(callbackUrl))
      , envelope_(std::move(envelope))
      , secret_(std::move(secret))
      , delivery_(std::move(delivery))
    {}

    void execute() override {
        delivery_->deliver(callbackUrl_, envelope_, secret_);
    }

    const char* name() const override { return "CallbackDeliveryCommand"; }

private:
    std::string callbackUrl_;
    domain::CallbackEnvelope envelope_;
    std::string secret_;
    std::shared_ptr<ports::output::ICallbackDeliveryClient> delivery_;
};

} // namespace jobhook::application
