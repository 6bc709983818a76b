#pragma once

#include "domain/enums/AnalysisErrorKind.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace jobhook::domain {

/**
 * @brief Итог вызова внешнего анализатора: либо result, либо типизированная ошибка
 */
struct AnalysisOutcome {
    bool success = false;
    nlohmann::json result;
    AnalysisErrorKind errorKind = AnalysisErrorKind::NONE;
    std::string message;

    static AnalysisOutcome ok(nlohmann::json result) {
        AnalysisOutcome outcome;
        outcome.success = true;
        outcome.result = std::move(result);
        return outcome;
    }

    static AnalysisOutcome failure(AnalysisErrorKind kind, std::string message) {
        AnalysisOutcome outcome;
        outcome.errorKind = kind;
        outcome.message = std::move(message);
        return outcome;
    }
};

} // namespace jobhook::domain
