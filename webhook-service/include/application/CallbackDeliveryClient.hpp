#pragma once

#include "ports/output/ICallbackDeliveryClient.hpp"
#include "ports/output/ISignatureCodec.hpp"
#include "ports/output/IJobRepository.hpp"
#include "ports/input/IMetricsService.hpp"
#include "settings/ICallbackSettings.hpp"
#include "domain/Errors.hpp"
#include "utils/UrlParser.hpp"

#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>

#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <thread>

namespace jobhook::application {

/**
 * @brief Доставка подписанного результата на callback URL
 *
 * Тело сериализуется один раз, подпись считается по этим же байтам.
 * Повтор: только при сетевой ошибке или 5xx, с экспоненциальной задержкой
 * base * 2^(n-1). 4xx означает постоянное расхождение и не повторяется.
 * Исход пишется в deliveryStatus задачи, её основное состояние не меняется.
 */
class CallbackDeliveryClient : public ports::output::ICallbackDeliveryClient {
public:
    static constexpr const char* SIGNATURE_HEADER = "X-Webhook-Signature";

    CallbackDeliveryClient(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<ports::output::ISignatureCodec> codec,
        std::shared_ptr<ports::output::IJobRepository> jobs,
        std::shared_ptr<settings::ICallbackSettings> settings,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : httpClient_(std::move(httpClient))
      , codec_(std::move(codec))
      , jobs_(std::move(jobs))
      , settings_(std::move(settings))
      , metrics_(std::move(metrics))
    {
        std::cout << "[CallbackDeliveryClient] Created, max attempts: "
                  << settings_->getMaxAttempts() << std::endl;
    }

    domain::DeliveryOutcome deliver(
        const std::string& callbackUrl,
        const domain::CallbackEnvelope& envelope,
        const std::string& secret
    ) override {
        domain::DeliveryOutcome outcome;
        const std::string& jobId = envelope.jobId;

        auto target = utils::UrlParser::parse(callbackUrl);
        if (!target) {
            std::cerr << "[CallbackDeliveryClient] " << jobId
                      << ": malformed callback URL, giving up" << std::endl;
            outcome.permanentFailure = true;
            return finish(jobId, outcome);
        }

        const std::string body = envelope.serialize();
        std::map<std::string, std::string> headers;
        headers["Content-Type"] = "application/json";
        headers[SIGNATURE_HEADER] = codec_->headerValue(secret, body);

        const int maxAttempts = settings_->getMaxAttempts();
        for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
            if (attempt > 1) {
                std::this_thread::sleep_for(backoffDelay(settings_->getBackoffBase(), attempt));
            }

            outcome.attempts = attempt;
            recordAttempt(jobId);
            metrics_->increment("callback_attempts_total");

            SimpleRequest request("POST", target->target, body, target->host, target->port, headers);
            SimpleResponse response;

            bool sent = false;
            try {
                sent = httpClient_->send(request, response);
            } catch (const std::exception& e) {
                std::cerr << "[CallbackDeliveryClient] " << jobId << ": attempt " << attempt
                          << " transport error: " << e.what() << std::endl;
            }

            if (!sent) {
                std::cerr << "[CallbackDeliveryClient] " << jobId << ": attempt " << attempt
                          << " not sent to " << target->host << std::endl;
                continue;
            }

            int status = response.getStatus();
            outcome.lastStatus = status;

            if (status >= 200 && status < 300) {
                outcome.result = domain::DeliveryResult::DELIVERED;
                std::cout << "[CallbackDeliveryClient] " << jobId << ": delivered on attempt "
                          << attempt << " (HTTP " << status << ")" << std::endl;
                return finish(jobId, outcome);
            }

            if (status >= 500 && status < 600) {
                std::cerr << "[CallbackDeliveryClient] " << jobId << ": attempt " << attempt
                          << " got HTTP " << status << ", will retry" << std::endl;
                continue;
            }

            // 4xx и всё прочее: получатель отверг запрос, повтор не поможет
            std::cerr << "[CallbackDeliveryClient] " << jobId << ": receiver rejected callback (HTTP "
                      << status << "), not retrying" << std::endl;
            outcome.permanentFailure = true;
            break;
        }

        return finish(jobId, outcome);
    }

    /**
     * @brief Пауза перед попыткой attempt (>= 2): base, 2*base, 4*base, ...
     */
    static std::chrono::milliseconds backoffDelay(std::chrono::milliseconds base, int attempt) {
        auto delay = base;
        for (int i = 2; i < attempt; ++i) {
            delay *= 2;
        }
        return delay;
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<ports::output::ISignatureCodec> codec_;
    std::shared_ptr<ports::output::IJobRepository> jobs_;
    std::shared_ptr<settings::ICallbackSettings> settings_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    void recordAttempt(const std::string& jobId) {
        try {
            jobs_->recordDeliveryAttempt(jobId);
        } catch (const domain::JobStoreError& e) {
            std::cerr << "[CallbackDeliveryClient] " << e.what() << std::endl;
        }
    }

    domain::DeliveryOutcome finish(const std::string& jobId, const domain::DeliveryOutcome& outcome) {
        bool delivered = outcome.result == domain::DeliveryResult::DELIVERED;
        try {
            jobs_->recordDeliveryOutcome(jobId, delivered
                ? domain::DeliveryStatus::DELIVERED
                : domain::DeliveryStatus::EXHAUSTED);
        } catch (const domain::JobStoreError& e) {
            std::cerr << "[CallbackDeliveryClient] " << e.what() << std::endl;
        }

        if (delivered) {
            metrics_->increment("callbacks_delivered_total");
        } else {
            metrics_->increment("callbacks_exhausted_total");
            std::cerr << "[CallbackDeliveryClient] DeliveryExhausted for " << jobId
                      << " after " << outcome.attempts << " attempt(s), last status "
                      << outcome.lastStatus << std::endl;
        }
        return outcome;
    }
};

} // namespace jobhook::application
