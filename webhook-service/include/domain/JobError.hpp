#pragma once

#include <string>

namespace jobhook::domain {

/**
 * @brief Ошибка выполнения задачи (код из AnalysisErrorKind или служебный)
 */
struct JobError {
    std::string code;
    std::string message;
};

} // namespace jobhook::domain
