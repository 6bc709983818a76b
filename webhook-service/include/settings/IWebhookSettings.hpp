#pragma once

#include <string>
#include <cstddef>

namespace jobhook::settings {

class IWebhookSettings {
public:
    virtual ~IWebhookSettings() = default;

    /// Общий секрет для HMAC входящих webhook'ов и исходящих callback'ов
    virtual const std::string& getSecret() const = 0;
    virtual std::size_t getMaxPayloadSize() const = 0;
};

} // namespace jobhook::settings
