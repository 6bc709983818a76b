#pragma once

#include <string>
#include <optional>

namespace jobhook::domain {

/**
 * @brief Входящий запрос на анализ (тело POST /api/v1/webhooks/job-analysis)
 *
 * Подпись проверяется по сырому телу запроса, а не по этой структуре.
 */
struct WebhookRequest {
    std::string jobId;
    std::string url;
    bool asyncProcessing = true;
    std::optional<std::string> callbackUrl;
};

} // namespace jobhook::domain
