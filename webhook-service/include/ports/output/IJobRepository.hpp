#pragma once

#include "domain/JobRecord.hpp"
#include "domain/JobError.hpp"
#include "domain/enums/JobState.hpp"
#include "domain/enums/DeliveryStatus.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <cstddef>

namespace jobhook::ports::output {

/**
 * @brief Хранилище задач: единственный разделяемый изменяемый ресурс
 *
 * Все операции атомарны по ключу. Ошибки: исключения из domain/Errors.hpp.
 */
class IJobRepository {
public:
    virtual ~IJobRepository() = default;

    /**
     * @brief Создать запись в состоянии ACCEPTED
     * @throws domain::ConflictError если jobId уже существует
     */
    virtual domain::JobRecord create(const std::string& jobId,
                                     const std::optional<std::string>& callbackUrl) = 0;

    /**
     * @throws domain::NotFoundError
     */
    virtual domain::JobRecord get(const std::string& jobId) const = 0;

    virtual bool exists(const std::string& jobId) const = 0;

    /**
     * @brief Перевести задачу в новое состояние
     *
     * SUCCEEDED требует result, FAILED требует error, прочие состояния не несут ни того, ни другого.
     *
     * @throws domain::InvalidTransitionError, domain::NotFoundError
     */
    virtual void transition(const std::string& jobId,
                            domain::JobState newState,
                            const std::optional<nlohmann::json>& result = std::nullopt,
                            const std::optional<domain::JobError>& error = std::nullopt) = 0;

    /**
     * @brief Увеличить счётчик попыток доставки
     * @return Новое значение счётчика
     */
    virtual int recordDeliveryAttempt(const std::string& jobId) = 0;

    virtual void recordDeliveryOutcome(const std::string& jobId, domain::DeliveryStatus status) = 0;

    /**
     * @brief Удалить записи по внешней политике хранения
     * @return Количество удалённых записей
     */
    virtual std::size_t evict(const std::function<bool(const domain::JobRecord&)>& predicate) = 0;
};

} // namespace jobhook::ports::output
