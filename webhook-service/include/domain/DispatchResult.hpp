#pragma once

#include "domain/enums/AnalysisErrorKind.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace jobhook::domain {

enum class DispatchStatus {
    COMPLETED,            ///< sync, результат в ответе
    ACCEPTED,             ///< async, задача поставлена в очередь
    UNAUTHORIZED,
    BAD_REQUEST,
    CONFLICT,
    PAYLOAD_TOO_LARGE,
    UPSTREAM_FAILED,      ///< sync, ошибка анализатора
    SERVICE_UNAVAILABLE   ///< async, пул воркеров не принял задачу
};

inline std::string toString(DispatchStatus status) {
    switch (status) {
        case DispatchStatus::COMPLETED: return "completed";
        case DispatchStatus::ACCEPTED: return "accepted";
        case DispatchStatus::UNAUTHORIZED: return "unauthorized";
        case DispatchStatus::BAD_REQUEST: return "bad_request";
        case DispatchStatus::CONFLICT: return "conflict";
        case DispatchStatus::PAYLOAD_TOO_LARGE: return "payload_too_large";
        case DispatchStatus::UPSTREAM_FAILED: return "upstream_failed";
        case DispatchStatus::SERVICE_UNAVAILABLE: return "service_unavailable";
        default: return "unknown";
    }
}

/**
 * @brief Результат обработки webhook'а диспетчером
 */
struct DispatchResult {
    DispatchStatus status = DispatchStatus::BAD_REQUEST;
    std::string jobId;
    nlohmann::json result;
    AnalysisErrorKind errorKind = AnalysisErrorKind::NONE;
    std::string message;
    Timestamp timestamp;
};

} // namespace jobhook::domain
