#pragma once

#include "domain/AnalysisOutcome.hpp"
#include <string>

namespace jobhook::ports::input {

/**
 * @brief Граница вызова анализатора
 *
 * Всегда возвращает определённый исход (успех или типизированная ошибка),
 * не бросает исключений и не трогает хранилище задач.
 */
class IAnalysisExecutor {
public:
    virtual ~IAnalysisExecutor() = default;

    virtual domain::AnalysisOutcome analyze(const std::string& url) = 0;
};

} // namespace jobhook::ports::input
