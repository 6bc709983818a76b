#pragma once

#include "domain/CallbackEnvelope.hpp"
#include "domain/DeliveryOutcome.hpp"
#include <string>

namespace jobhook::ports::output {

/**
 * @brief Подписать и доставить результат на callback URL вызывающей стороны
 */
class ICallbackDeliveryClient {
public:
    virtual ~ICallbackDeliveryClient() = default;

    virtual domain::DeliveryOutcome deliver(const std::string& callbackUrl,
                                            const domain::CallbackEnvelope& envelope,
                                            const std::string& secret) = 0;
};

} // namespace jobhook::ports::output
