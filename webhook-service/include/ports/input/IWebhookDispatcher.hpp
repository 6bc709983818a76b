#pragma once

#include "domain/DispatchResult.hpp"
#include "domain/AnalysisOutcome.hpp"
#include <optional>
#include <string>

namespace jobhook::ports::input {

/**
 * @brief Оркестрация входящего webhook'а
 */
class IWebhookDispatcher {
public:
    virtual ~IWebhookDispatcher() = default;

    /**
     * @brief Проверить подпись, разобрать запрос и выполнить sync или async ветку
     *
     * @param rawBody Тело запроса байт в байт
     * @param signatureHeader Значение X-Webhook-Signature (если есть)
     */
    virtual domain::DispatchResult handleWebhook(
        const std::string& rawBody,
        const std::optional<std::string>& signatureHeader) = 0;

    /**
     * @brief Обработчик завершения фонового анализа
     *
     * Фиксирует терминальное состояние задачи и передаёт результат на доставку.
     */
    virtual void onAnalysisCompleted(const std::string& jobId,
                                     const domain::AnalysisOutcome& outcome) = 0;
};

} // namespace jobhook::ports::input
