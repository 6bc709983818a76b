#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace jobhook::settings {

/**
 * @brief Метрики webhook-сервиса
 *
 * - HTTP метрики (запросы к endpoints)
 * - Исходы обработки webhook'ов
 * - Жизненный цикл задач и доставка callback'ов
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"webhooks_received_total", "Webhook requests by dispatch result", "counter"},
            {"jobs_accepted_total", "Async jobs accepted", "counter"},
            {"jobs_succeeded_total", "Jobs finished with a result", "counter"},
            {"jobs_failed_total", "Jobs finished with an error", "counter"},
            {"callback_attempts_total", "Callback POST attempts", "counter"},
            {"callbacks_delivered_total", "Callbacks accepted by receiver", "counter"},
            {"callbacks_exhausted_total", "Callbacks never accepted after retries", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            // ============================================
            // HTTP метрики (method + path)
            // ============================================
            "http_requests_total{method=\"GET\",path=\"/\"}",
            "http_requests_total{method=\"GET\",path=\"/health\"}",
            "http_requests_total{method=\"GET\",path=\"/metrics\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/webhooks/health\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/webhooks/job-analysis\"}",

            // ============================================
            // Исходы webhook'ов
            // ============================================
            "webhooks_received_total{result=\"completed\"}",
            "webhooks_received_total{result=\"accepted\"}",
            "webhooks_received_total{result=\"unauthorized\"}",
            "webhooks_received_total{result=\"bad_request\"}",
            "webhooks_received_total{result=\"conflict\"}",
            "webhooks_received_total{result=\"payload_too_large\"}",
            "webhooks_received_total{result=\"upstream_failed\"}",
            "webhooks_received_total{result=\"service_unavailable\"}",

            // ============================================
            // Задачи и доставка (без labels)
            // ============================================
            "jobs_accepted_total",
            "jobs_succeeded_total",
            "jobs_failed_total",
            "callback_attempts_total",
            "callbacks_delivered_total",
            "callbacks_exhausted_total"
        };
    }
};

} // namespace jobhook::settings
