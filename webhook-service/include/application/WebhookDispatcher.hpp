#pragma once

#include "ports/input/IWebhookDispatcher.hpp"
#include "ports/input/IAnalysisExecutor.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ISignatureCodec.hpp"
#include "ports/output/IJobRepository.hpp"
#include "ports/output/IJobScheduler.hpp"
#include "ports/output/ICallbackDeliveryClient.hpp"
#include "settings/IWebhookSettings.hpp"
#include "application/AnalysisJobCommand.hpp"
#include "application/CallbackDeliveryCommand.hpp"
#include "domain/WebhookRequest.hpp"
#include "domain/CallbackEnvelope.hpp"
#include "domain/Errors.hpp"
#include "utils/UrlParser.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace jobhook::application {

/**
 * @brief Оркестратор входящих webhook'ов
 *
 * Порядок обработки:
 * 1. Размер тела (до разбора)
 * 2. Подпись X-Webhook-Signature по сырому телу; без неё тело не разбирается
 * 3. Разбор и валидация WebhookRequest
 * 4. sync: анализ в потоке запроса, результат в ответе, задача не сохраняется
 *    async: запись ACCEPTED, команда в пул воркеров, немедленный ответ
 *
 * Фоновая команда отдаёт исход в onAnalysisCompleted(), который ставит
 * SUCCEEDED/FAILED и передаёт конверт на доставку callback'а.
 *
 * @note Должен принадлежать std::shared_ptr: фоновые команды держат
 *       ссылку на диспетчер через shared_from_this().
 */
class WebhookDispatcher : public ports::input::IWebhookDispatcher,
                          public std::enable_shared_from_this<WebhookDispatcher> {
public:
    WebhookDispatcher(
        std::shared_ptr<ports::output::ISignatureCodec> codec,
        std::shared_ptr<ports::output::IJobRepository> jobs,
        std::shared_ptr<ports::input::IAnalysisExecutor> executor,
        std::shared_ptr<ports::output::IJobScheduler> scheduler,
        std::shared_ptr<ports::output::ICallbackDeliveryClient> delivery,
        std::shared_ptr<settings::IWebhookSettings> settings,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : codec_(std::move(codec))
      , jobs_(std::move(jobs))
      , executor_(std::move(executor))
      , scheduler_(std::move(scheduler))
      , delivery_(std::move(delivery))
      , settings_(std::move(settings))
      , metrics_(std::move(metrics))
    {
        std::cout << "[WebhookDispatcher] Created" << std::endl;
    }

    domain::DispatchResult handleWebhook(
        const std::string& rawBody,
        const std::optional<std::string>& signatureHeader
    ) override {
        domain::DispatchResult result;

        if (rawBody.size() > settings_->getMaxPayloadSize()) {
            std::cerr << "[WebhookDispatcher] Rejected: payload of " << rawBody.size()
                      << " bytes exceeds limit" << std::endl;
            result.status = domain::DispatchStatus::PAYLOAD_TOO_LARGE;
            return finish(result);
        }

        if (!signatureHeader || !codec_->verify(settings_->getSecret(), rawBody, *signatureHeader)) {
            std::cerr << "[WebhookDispatcher] Rejected: signature check failed" << std::endl;
            result.status = domain::DispatchStatus::UNAUTHORIZED;
            return finish(result);
        }

        auto request = parseRequest(rawBody);
        if (!request) {
            result.status = domain::DispatchStatus::BAD_REQUEST;
            return finish(result);
        }

        result.jobId = request->jobId;
        std::cout << "[WebhookDispatcher] Processing job " << request->jobId
                  << (request->asyncProcessing ? " (async)" : " (sync)") << std::endl;

        if (!request->asyncProcessing) {
            return finish(runSync(*request, result));
        }
        return finish(acceptAsync(*request, result));
    }

    void onAnalysisCompleted(
        const std::string& jobId,
        const domain::AnalysisOutcome& outcome
    ) override {
        domain::CallbackEnvelope envelope;
        envelope.jobId = jobId;

        try {
            if (outcome.success) {
                jobs_->transition(jobId, domain::JobState::SUCCEEDED, outcome.result);
                metrics_->increment("jobs_succeeded_total");
                envelope.result = outcome.result;
                std::cout << "[WebhookDispatcher] Job " << jobId << " -> SUCCEEDED" << std::endl;
            } else {
                domain::JobError error{domain::toString(outcome.errorKind), outcome.message};
                jobs_->transition(jobId, domain::JobState::FAILED, std::nullopt, error);
                metrics_->increment("jobs_failed_total");
                envelope.error = error;
                std::cerr << "[WebhookDispatcher] Job " << jobId << " -> FAILED ("
                          << error.code << ": " << error.message << ")" << std::endl;
            }
        } catch (const domain::JobStoreError& e) {
            std::cerr << "[WebhookDispatcher] Cannot complete job " << jobId << ": " << e.what() << std::endl;
            return;
        }

        std::optional<std::string> callbackUrl;
        try {
            callbackUrl = jobs_->get(jobId).callbackUrl;
        } catch (const domain::NotFoundError& e) {
            std::cerr << "[WebhookDispatcher] " << e.what() << std::endl;
            return;
        }
        if (!callbackUrl) {
            return;
        }

        envelope.timestamp = domain::Timestamp::now();
        auto command = std::make_shared<CallbackDeliveryCommand>(
            *callbackUrl, envelope, settings_->getSecret(), delivery_);

        // Уже в фоновом потоке: если очередь занята, доставляем здесь же
        if (!scheduler_->schedule(command)) {
            std::cerr << "[WebhookDispatcher] Delivery queue refused job " << jobId
                      << ", delivering inline" << std::endl;
            command->execute();
        }
    }

private:
    std::shared_ptr<ports::output::ISignatureCodec> codec_;
    std::shared_ptr<ports::output::IJobRepository> jobs_;
    std::shared_ptr<ports::input::IAnalysisExecutor> executor_;
    std::shared_ptr<ports::output::IJobScheduler> scheduler_;
    std::shared_ptr<ports::output::ICallbackDeliveryClient> delivery_;
    std::shared_ptr<settings::IWebhookSettings> settings_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    domain::DispatchResult& runSync(const domain::WebhookRequest& request, domain::DispatchResult& result) {
        auto outcome = executor_->analyze(request.url);
        if (outcome.success) {
            result.status = domain::DispatchStatus::COMPLETED;
            result.result = outcome.result;
            result.message = "Job analysis completed successfully";
        } else {
            result.status = domain::DispatchStatus::UPSTREAM_FAILED;
            result.errorKind = outcome.errorKind;
            result.message = outcome.message;
            std::cerr << "[WebhookDispatcher] Sync job " << request.jobId << " failed: "
                      << domain::toString(outcome.errorKind) << std::endl;
        }
        return result;
    }

    domain::DispatchResult& acceptAsync(const domain::WebhookRequest& request, domain::DispatchResult& result) {
        try {
            jobs_->create(request.jobId, request.callbackUrl);
        } catch (const domain::ConflictError& e) {
            std::cerr << "[WebhookDispatcher] " << e.what() << std::endl;
            result.status = domain::DispatchStatus::CONFLICT;
            return result;
        }

        std::weak_ptr<WebhookDispatcher> weakSelf = shared_from_this();
        auto command = std::make_shared<AnalysisJobCommand>(
            request.jobId, request.url, jobs_, executor_,
            [weakSelf](const std::string& jobId, const domain::AnalysisOutcome& outcome) {
                if (auto self = weakSelf.lock()) {
                    self->onAnalysisCompleted(jobId, outcome);
                }
            });

        if (!scheduler_->schedule(command)) {
            // Запись убираем, чтобы вызывающий мог повторить тот же job_id
            std::cerr << "[WebhookDispatcher] Worker pool refused job " << request.jobId << std::endl;
            const std::string jobId = request.jobId;
            jobs_->evict([&jobId](const domain::JobRecord& r) { return r.jobId == jobId; });
            result.status = domain::DispatchStatus::SERVICE_UNAVAILABLE;
            return result;
        }

        metrics_->increment("jobs_accepted_total");
        result.status = domain::DispatchStatus::ACCEPTED;
        result.message = "Job analysis started in background";
        return result;
    }

    /**
     * @brief Разбор тела; причина отказа пишется только в лог
     */
    std::optional<domain::WebhookRequest> parseRequest(const std::string& rawBody) const {
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(rawBody);
        } catch (const nlohmann::json::exception&) {
            std::cerr << "[WebhookDispatcher] Rejected: body is not valid JSON" << std::endl;
            return std::nullopt;
        }

        if (!body.is_object()) {
            std::cerr << "[WebhookDispatcher] Rejected: body is not a JSON object" << std::endl;
            return std::nullopt;
        }

        domain::WebhookRequest request;

        auto jobId = stringField(body, "job_id");
        if (!jobId || jobId->empty()) {
            std::cerr << "[WebhookDispatcher] Rejected: job_id missing or empty" << std::endl;
            return std::nullopt;
        }
        request.jobId = *jobId;

        auto url = stringField(body, "url");
        if (!url || !utils::UrlParser::isValid(*url)) {
            std::cerr << "[WebhookDispatcher] Rejected: url missing or malformed" << std::endl;
            return std::nullopt;
        }
        request.url = *url;

        if (body.contains("async_processing")) {
            const auto& flag = body["async_processing"];
            if (!flag.is_boolean()) {
                std::cerr << "[WebhookDispatcher] Rejected: async_processing is not a boolean" << std::endl;
                return std::nullopt;
            }
            request.asyncProcessing = flag.get<bool>();
        }

        if (request.asyncProcessing) {
            auto callbackUrl = stringField(body, "callback_url");
            if (!callbackUrl || !utils::UrlParser::isValid(*callbackUrl)) {
                std::cerr << "[WebhookDispatcher] Rejected: async job without valid callback_url" << std::endl;
                return std::nullopt;
            }
            request.callbackUrl = *callbackUrl;
        }

        return request;
    }

    /**
     * @brief Строковое поле без окружающих пробелов; nullopt если нет или не строка
     */
    static std::optional<std::string> stringField(const nlohmann::json& body, const char* name) {
        auto it = body.find(name);
        if (it == body.end() || !it->is_string()) {
            return std::nullopt;
        }
        const auto& raw = it->get_ref<const std::string&>();
        auto begin = raw.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return std::string();
        }
        auto end = raw.find_last_not_of(" \t\r\n");
        return raw.substr(begin, end - begin + 1);
    }

    domain::DispatchResult& finish(domain::DispatchResult& result) {
        metrics_->increment("webhooks_received_total", {{"result", domain::toString(result.status)}});
        return result;
    }
};

} // namespace jobhook::application
