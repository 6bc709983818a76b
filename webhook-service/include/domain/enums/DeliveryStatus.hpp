#pragma once

#include <string>

namespace jobhook::domain {

/**
 * @brief Статус доставки callback'а
 *
 * Отделён от JobState: исход доставки не меняет результат выполнения.
 */
enum class DeliveryStatus {
    NOT_REQUESTED,
    PENDING,
    DELIVERED,
    EXHAUSTED
};

inline std::string toString(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::NOT_REQUESTED: return "NOT_REQUESTED";
        case DeliveryStatus::PENDING: return "PENDING";
        case DeliveryStatus::DELIVERED: return "DELIVERED";
        case DeliveryStatus::EXHAUSTED: return "EXHAUSTED";
        default: return "UNKNOWN";
    }
}

} // namespace jobhook::domain
