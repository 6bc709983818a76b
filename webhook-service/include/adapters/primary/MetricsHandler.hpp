#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>
#include <iostream>

namespace jobhook::adapters::primary {

/**
 * @brief HTTP handler для endpoint /metrics
 *
 * Prometheus text format 0.0.4: счётчики webhook'ов, задач и доставки callback'ов.
 *
 * @example Response:
 * ```
 * # HELP webhooks_received_total Inbound webhooks by dispatch result
 * # TYPE webhooks_received_total counter
 * webhooks_received_total{result="accepted"} 12
 * ```
 */
class MetricsHandler : public IHttpHandler {
public:
    explicit MetricsHandler(std::shared_ptr<ports::input::IMetricsService> metrics)
        : metrics_(std::move(metrics))
    {
        std::cout << "[MetricsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        res.setStatus(200);
        res.setHeader("Content-Type", "text/plain; version=0.0.4; charset=utf-8");
        res.setBody(metrics_->toPrometheusFormat());
    }

private:
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace jobhook::adapters::primary
