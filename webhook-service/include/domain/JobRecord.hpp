#pragma once

#include "domain/JobError.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/JobState.hpp"
#include "domain/enums/DeliveryStatus.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace jobhook::domain {

/**
 * @brief Запись о задаче в хранилище
 *
 * result есть только в SUCCEEDED, error только в FAILED.
 * deliveryAttempts/deliveryStatus меняет только клиент доставки callback'ов.
 */
struct JobRecord {
    std::string jobId;
    JobState state = JobState::ACCEPTED;
    Timestamp createdAt;
    Timestamp updatedAt;
    std::optional<nlohmann::json> result;
    std::optional<JobError> error;
    std::optional<std::string> callbackUrl;
    int deliveryAttempts = 0;
    DeliveryStatus deliveryStatus = DeliveryStatus::NOT_REQUESTED;
};

} // namespace jobhook::domain
