#pragma once

#include "settings/IWebhookSettings.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace jobhook::settings {

/**
 * @brief Настройки приёма webhook'ов
 *
 * Читаются из окружения один раз при создании и дальше не меняются.
 * Пустой WEBHOOK_SECRET: ошибка конфигурации: без секрета сервис не стартует.
 */
class WebhookSettings : public IWebhookSettings {
public:
    WebhookSettings() {
        if (const char* secret = std::getenv("WEBHOOK_SECRET")) {
            secret_ = secret;
        }
        if (secret_.empty()) {
            throw std::runtime_error("WEBHOOK_SECRET is not configured");
        }
        if (const char* size = std::getenv("WEBHOOK_MAX_PAYLOAD_SIZE")) {
            maxPayloadSize_ = static_cast<std::size_t>(std::stoul(size));
        }
    }

    const std::string& getSecret() const override { return secret_; }
    std::size_t getMaxPayloadSize() const override { return maxPayloadSize_; }

private:
    std::string secret_;
    std::size_t maxPayloadSize_ = 1024 * 1024;
};

} // namespace jobhook::settings
