#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IWebhookDispatcher.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace jobhook::adapters::primary
{

    /**
     * @brief POST /api/v1/webhooks/job-analysis: приём подписанного webhook'а
     *
     * Подпись берётся из заголовка X-Webhook-Signature, тело передаётся
     * диспетчеру как есть (проверка идёт по сырым байтам).
     *
     * Ответы:
     * - 200 sync, анализ выполнен
     * - 202 async, задача принята
     * - 401 / 422 / 409 / 413: отказ до выполнения
     * - 502 / 504: ошибка анализатора (только sync)
     * - 503: пул воркеров не принял задачу
     */
    class JobAnalysisWebhookHandler : public IHttpHandler
    {
    public:
        static constexpr const char *SIGNATURE_HEADER = "X-Webhook-Signature";

        explicit JobAnalysisWebhookHandler(
            std::shared_ptr<ports::input::IWebhookDispatcher> dispatcher) : dispatcher_(std::move(dispatcher))
        {
            std::cout << "[JobAnalysisWebhookHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto result = dispatcher_->handleWebhook(req.getBody(), req.getHeader(SIGNATURE_HEADER));
                writeResult(res, result);
            }
            catch (const nlohmann::json::exception &e)
            {
                std::cerr << "[JobAnalysisWebhookHandler] JSON error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[JobAnalysisWebhookHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IWebhookDispatcher> dispatcher_;

        void writeResult(IResponse &res, const domain::DispatchResult &result)
        {
            nlohmann::json response;

            switch (result.status)
            {
            case domain::DispatchStatus::COMPLETED:
                response["status"] = "completed";
                response["job_id"] = result.jobId;
                response["result"] = result.result;
                response["message"] = result.message;
                response["timestamp"] = result.timestamp.toString();
                res.setResult(200, "application/json", response.dump());
                return;

            case domain::DispatchStatus::ACCEPTED:
                response["status"] = "accepted";
                response["job_id"] = result.jobId;
                response["message"] = result.message;
                response["timestamp"] = result.timestamp.toString();
                res.setResult(202, "application/json", response.dump());
                return;

            case domain::DispatchStatus::UNAUTHORIZED:
                sendError(res, 401, "Unauthorized");
                return;

            case domain::DispatchStatus::BAD_REQUEST:
                sendError(res, 422, "Invalid request");
                return;

            case domain::DispatchStatus::CONFLICT:
                response["error"] = "Job already exists";
                response["job_id"] = result.jobId;
                res.setResult(409, "application/json", response.dump());
                return;

            case domain::DispatchStatus::PAYLOAD_TOO_LARGE:
                sendError(res, 413, "Payload too large");
                return;

            case domain::DispatchStatus::UPSTREAM_FAILED:
                response["error"] = result.message;
                response["code"] = domain::toString(result.errorKind);
                response["job_id"] = result.jobId;
                res.setResult(
                    result.errorKind == domain::AnalysisErrorKind::UPSTREAM_TIMEOUT ? 504 : 502,
                    "application/json", response.dump());
                return;

            case domain::DispatchStatus::SERVICE_UNAVAILABLE:
                sendError(res, 503, "Service unavailable");
                return;
            }

            sendError(res, 500, "Internal server error");
        }

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace jobhook::adapters::primary
