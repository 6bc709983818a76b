#pragma once

#include <chrono>

namespace jobhook::settings {

class ICallbackSettings {
public:
    virtual ~ICallbackSettings() = default;

    virtual int getMaxAttempts() const = 0;
    /// Задержка перед второй попыткой; далее удваивается
    virtual std::chrono::milliseconds getBackoffBase() const = 0;
};

} // namespace jobhook::settings
