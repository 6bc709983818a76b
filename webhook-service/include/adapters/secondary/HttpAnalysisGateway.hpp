#pragma once

#include "ports/output/IAnalysisGateway.hpp"
#include "settings/IAnalysisClientSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <iostream>

namespace jobhook::adapters::secondary {

/**
 * @brief HTTP клиент к сервису анализа вакансий (LLM)
 *
 * POST {path} {"url": ..., "provider": ..., "model": ...}
 *
 * Ответ 2xx с JSON-объектом: успех; result берётся из поля "result",
 * если оно есть, иначе всё тело. Таймаут здесь не отслеживается,
 * это делает AnalysisExecutor.
 */
class HttpAnalysisGateway : public ports::output::IAnalysisGateway {
public:
    HttpAnalysisGateway(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IAnalysisClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpAnalysisGateway] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << settings_->getPath() << " (" << settings_->getProvider()
                  << "/" << settings_->getModel() << ")" << std::endl;
    }

    domain::AnalysisOutcome analyze(const std::string& url) override {
        nlohmann::json body;
        body["url"] = url;
        body["provider"] = settings_->getProvider();
        body["model"] = settings_->getModel();

        std::map<std::string, std::string> headers;
        headers["Content-Type"] = "application/json";
        if (!settings_->getApiKey().empty()) {
            headers["Authorization"] = "Bearer " + settings_->getApiKey();
        }

        SimpleRequest request(
            "POST",
            settings_->getPath(),
            body.dump(),
            settings_->getHost(),
            settings_->getPort(),
            headers
        );
        SimpleResponse response;

        try {
            if (!httpClient_->send(request, response)) {
                std::cerr << "[HttpAnalysisGateway] analyze: request not sent" << std::endl;
                return domain::AnalysisOutcome::failure(
                    domain::AnalysisErrorKind::UPSTREAM_UNAVAILABLE,
                    "Analysis service is unreachable");
            }
        } catch (const std::exception& e) {
            std::cerr << "[HttpAnalysisGateway] analyze error: " << e.what() << std::endl;
            return domain::AnalysisOutcome::failure(
                domain::AnalysisErrorKind::UPSTREAM_UNAVAILABLE,
                std::string("Analysis service error: ") + e.what());
        }

        int status = response.getStatus();
        if (status == 408 || status == 504) {
            return domain::AnalysisOutcome::failure(
                domain::AnalysisErrorKind::UPSTREAM_TIMEOUT,
                "Analysis service timed out (HTTP " + std::to_string(status) + ")");
        }
        if (status >= 500) {
            std::cerr << "[HttpAnalysisGateway] analyze failed: " << status << std::endl;
            return domain::AnalysisOutcome::failure(
                domain::AnalysisErrorKind::UPSTREAM_UNAVAILABLE,
                "Analysis service returned HTTP " + std::to_string(status));
        }
        if (status < 200 || status >= 300) {
            std::cerr << "[HttpAnalysisGateway] analyze rejected: " << status << std::endl;
            return domain::AnalysisOutcome::failure(
                domain::AnalysisErrorKind::UPSTREAM_INVALID_RESPONSE,
                "Analysis service returned HTTP " + std::to_string(status));
        }

        nlohmann::json json;
        try {
            json = nlohmann::json::parse(response.getBody());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[HttpAnalysisGateway] invalid JSON: " << e.what() << std::endl;
            return domain::AnalysisOutcome::failure(
                domain::AnalysisErrorKind::UPSTREAM_INVALID_RESPONSE,
                "Analysis service returned malformed JSON");
        }

        if (!json.is_object()) {
            return domain::AnalysisOutcome::failure(
                domain::AnalysisErrorKind::UPSTREAM_INVALID_RESPONSE,
                "Analysis service returned a non-object result");
        }

        if (json.contains("result")) {
            return domain::AnalysisOutcome::ok(json["result"]);
        }
        return domain::AnalysisOutcome::ok(json);
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IAnalysisClientSettings> settings_;
};

} // namespace jobhook::adapters::secondary
