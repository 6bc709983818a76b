#pragma once

#include <string>

namespace jobhook::domain {

enum class DeliveryResult {
    DELIVERED,
    EXHAUSTED
};

inline std::string toString(DeliveryResult result) {
    return result == DeliveryResult::DELIVERED ? "DELIVERED" : "EXHAUSTED";
}

/**
 * @brief Итог доставки callback'а
 *
 * permanentFailure: получатель ответил 4xx, повторов не было.
 */
struct DeliveryOutcome {
    DeliveryResult result = DeliveryResult::EXHAUSTED;
    int attempts = 0;
    int lastStatus = 0;
    bool permanentFailure = false;
};

} // namespace jobhook::domain
