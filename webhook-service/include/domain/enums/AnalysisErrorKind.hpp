#pragma once

#include <string>

namespace jobhook::domain {

enum class AnalysisErrorKind {
    NONE,
    UPSTREAM_UNAVAILABLE,
    UPSTREAM_TIMEOUT,
    UPSTREAM_INVALID_RESPONSE
};

inline std::string toString(AnalysisErrorKind kind) {
    switch (kind) {
        case AnalysisErrorKind::NONE: return "NONE";
        case AnalysisErrorKind::UPSTREAM_UNAVAILABLE: return "UPSTREAM_UNAVAILABLE";
        case AnalysisErrorKind::UPSTREAM_TIMEOUT: return "UPSTREAM_TIMEOUT";
        case AnalysisErrorKind::UPSTREAM_INVALID_RESPONSE: return "UPSTREAM_INVALID_RESPONSE";
        default: return "UNKNOWN";
    }
}

} // namespace jobhook::domain
