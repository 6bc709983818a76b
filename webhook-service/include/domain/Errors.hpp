#pragma once

#include <stdexcept>
#include <string>

namespace jobhook::domain {

/**
 * @brief Базовое исключение хранилища задач
 */
class JobStoreError : public std::runtime_error {
public:
    explicit JobStoreError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConflictError : public JobStoreError {
public:
    explicit ConflictError(const std::string& jobId)
        : JobStoreError("Job already exists: " + jobId) {}
};

class NotFoundError : public JobStoreError {
public:
    explicit NotFoundError(const std::string& jobId)
        : JobStoreError("Job not found: " + jobId) {}
};

class InvalidTransitionError : public JobStoreError {
public:
    explicit InvalidTransitionError(const std::string& message)
        : JobStoreError(message) {}
};

} // namespace jobhook::domain
