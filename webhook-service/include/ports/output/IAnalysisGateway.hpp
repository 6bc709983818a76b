#pragma once

#include "domain/AnalysisOutcome.hpp"
#include <string>

namespace jobhook::ports::output {

/**
 * @brief Внешний сервис анализа (LLM): чёрный ящик
 */
class IAnalysisGateway {
public:
    virtual ~IAnalysisGateway() = default;

    virtual domain::AnalysisOutcome analyze(const std::string& url) = 0;
};

} // namespace jobhook::ports::output
