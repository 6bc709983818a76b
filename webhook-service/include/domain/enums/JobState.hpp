#pragma once

#include <string>

namespace jobhook::domain {

/**
 * @brief Состояние задачи анализа
 *
 * RECEIVED -> VALIDATING -> REJECTED
 *                        -> EXECUTING (sync) -> SUCCEEDED | FAILED
 *                        -> ACCEPTED (async) -> EXECUTING -> SUCCEEDED | FAILED
 *
 * В хранилище попадают только async задачи, начиная с ACCEPTED.
 */
enum class JobState {
    RECEIVED,
    VALIDATING,
    REJECTED,
    ACCEPTED,
    EXECUTING,
    SUCCEEDED,
    FAILED
};

inline std::string toString(JobState state) {
    switch (state) {
        case JobState::RECEIVED: return "RECEIVED";
        case JobState::VALIDATING: return "VALIDATING";
        case JobState::REJECTED: return "REJECTED";
        case JobState::ACCEPTED: return "ACCEPTED";
        case JobState::EXECUTING: return "EXECUTING";
        case JobState::SUCCEEDED: return "SUCCEEDED";
        case JobState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline bool isTerminal(JobState state) {
    return state == JobState::SUCCEEDED
        || state == JobState::FAILED
        || state == JobState::REJECTED;
}

/**
 * @brief Допустим ли переход from -> to
 */
inline bool canTransition(JobState from, JobState to) {
    switch (from) {
        case JobState::RECEIVED:
            return to == JobState::VALIDATING;
        case JobState::VALIDATING:
            return to == JobState::REJECTED
                || to == JobState::EXECUTING
                || to == JobState::ACCEPTED;
        case JobState::ACCEPTED:
            return to == JobState::EXECUTING
                || to == JobState::SUCCEEDED
                || to == JobState::FAILED;
        case JobState::EXECUTING:
            return to == JobState::SUCCEEDED || to == JobState::FAILED;
        default:
            return false;
    }
}

} // namespace jobhook::domain
