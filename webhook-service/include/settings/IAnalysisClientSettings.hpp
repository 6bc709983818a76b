#pragma once

#include <string>
#include <chrono>
#include <cstddef>

namespace jobhook::settings {

class IAnalysisClientSettings {
public:
    virtual ~IAnalysisClientSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual std::string getPath() const = 0;
    virtual std::string getProvider() const = 0;
    virtual std::string getModel() const = 0;
    virtual std::string getApiKey() const = 0;
    virtual std::chrono::milliseconds getTimeout() const = 0;
    virtual std::size_t getMaxInFlight() const = 0;
};

} // namespace jobhook::settings
