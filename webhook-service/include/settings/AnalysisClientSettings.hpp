#pragma once

#include "settings/IAnalysisClientSettings.hpp"
#include <cstddef>
#include <cstdlib>
#include <string>

namespace jobhook::settings {

/**
 * @brief Настройки клиента внешнего сервиса анализа
 */
class AnalysisClientSettings : public IAnalysisClientSettings {
public:
    AnalysisClientSettings() {
        if (const char* host = std::getenv("ANALYSIS_SERVICE_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("ANALYSIS_SERVICE_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* path = std::getenv("ANALYSIS_SERVICE_PATH")) {
            path_ = path;
        }
        if (const char* provider = std::getenv("LLM_PROVIDER")) {
            provider_ = provider;
        }
        if (const char* model = std::getenv("LLM_MODEL_NAME")) {
            model_ = model;
        }
        if (const char* apiKey = std::getenv("LLM_API_KEY")) {
            apiKey_ = apiKey;
        }
        if (const char* timeout = std::getenv("ANALYSIS_TIMEOUT_MS")) {
            timeout_ = std::chrono::milliseconds(std::stol(timeout));
        }
        if (const char* maxInFlight = std::getenv("ANALYSIS_MAX_IN_FLIGHT")) {
            maxInFlight_ = std::stoul(maxInFlight);
        }
    }

    std::string getHost() const override { return host_; }
    int getPort() const override { return port_; }
    std::string getPath() const override { return path_; }
    std::string getProvider() const override { return provider_; }
    std::string getModel() const override { return model_; }
    std::string getApiKey() const override { return apiKey_; }
    std::chrono::milliseconds getTimeout() const override { return timeout_; }
    std::size_t getMaxInFlight() const override { return maxInFlight_; }

private:
    std::string host_ = "localhost";
    int port_ = 8090;
    std::string path_ = "/api/v1/analyze";
    std::string provider_ = "gemini";
    std::string model_ = "gemini-1.5-flash";
    std::string apiKey_;
    std::chrono::milliseconds timeout_{30000};
    std::size_t maxInFlight_ = 8;
};

} // namespace jobhook::settings
