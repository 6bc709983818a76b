#pragma once

#include <string>
#include <map>

namespace jobhook::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Только counter метрики с опциональными labels, сериализация в
 * Prometheus text format.
 *
 * @example
 * ```cpp
 * metricsService->increment("callbacks_exhausted_total");
 * metricsService->increment("webhooks_received_total", {{"result", "accepted"}});
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Инкрементировать счётчик метрики
     *
     * @param name Имя метрики
     * @param labels Опциональные labels в формате {key: value}
     *
     * @note Ключ метрики формируется как "name{label1=\"value1\",label2=\"value2\"}"
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @brief Текущее значение счётчика (0, если метрики нет)
     */
    virtual long long value(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) const = 0;

    /**
     * @brief Сериализовать метрики в Prometheus формат (version 0.0.4)
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace jobhook::ports::input
