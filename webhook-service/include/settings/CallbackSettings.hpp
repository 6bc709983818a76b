#pragma once

#include "settings/ICallbackSettings.hpp"
#include <cstdlib>
#include <string>

namespace jobhook::settings {

class CallbackSettings : public ICallbackSettings {
public:
    CallbackSettings() {
        if (const char* attempts = std::getenv("CALLBACK_MAX_ATTEMPTS")) {
            maxAttempts_ = std::stoi(attempts);
        }
        if (const char* backoff = std::getenv("CALLBACK_BACKOFF_BASE_MS")) {
            backoffBase_ = std::chrono::milliseconds(std::stol(backoff));
        }
        if (maxAttempts_ < 1) {
            maxAttempts_ = 1;
        }
    }

    int getMaxAttempts() const override { return maxAttempts_; }
    std::chrono::milliseconds getBackoffBase() const override { return backoffBase_; }

private:
    int maxAttempts_ = 3;
    std::chrono::milliseconds backoffBase_{500};
};

} // namespace jobhook::settings
