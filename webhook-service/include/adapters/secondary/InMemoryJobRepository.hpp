#pragma once

#include "ports/output/IJobRepository.hpp"
#include "domain/Errors.hpp"
#include <ThreadSafeMap.hpp>

#include <iostream>
#include <memory>

namespace jobhook::adapters::secondary {

/**
 * @brief In-memory реализация IJobRepository
 *
 * Поверх ThreadSafeMap: create() через insertIfAbsent (ровно один победитель
 * на job_id), изменения через update() (copy-on-write под эксклюзивной
 * блокировкой). get() возвращает копию, читатель не видит полузаписанных полей.
 */
class InMemoryJobRepository : public ports::output::IJobRepository {
public:
    InMemoryJobRepository() {
        std::cout << "[InMemoryJobRepository] Created" << std::endl;
    }

    domain::JobRecord create(const std::string& jobId,
                             const std::optional<std::string>& callbackUrl) override {
        auto record = std::make_shared<domain::JobRecord>();
        record->jobId = jobId;
        record->state = domain::JobState::ACCEPTED;
        record->createdAt = domain::Timestamp::now();
        record->updatedAt = record->createdAt;
        record->callbackUrl = callbackUrl;
        record->deliveryStatus = callbackUrl
            ? domain::DeliveryStatus::PENDING
            : domain::DeliveryStatus::NOT_REQUESTED;

        if (!jobs_.insertIfAbsent(jobId, record)) {
            throw domain::ConflictError(jobId);
        }
        return *record;
    }

    domain::JobRecord get(const std::string& jobId) const override {
        auto record = jobs_.find(jobId);
        if (!record) {
            throw domain::NotFoundError(jobId);
        }
        return *record;
    }

    bool exists(const std::string& jobId) const override {
        return jobs_.contains(jobId);
    }

    void transition(const std::string& jobId,
                    domain::JobState newState,
                    const std::optional<nlohmann::json>& result = std::nullopt,
                    const std::optional<domain::JobError>& error = std::nullopt) override {
        if (newState == domain::JobState::SUCCEEDED && (!result || error)) {
            throw domain::InvalidTransitionError("SUCCEEDED requires a result and no error: " + jobId);
        }
        if (newState == domain::JobState::FAILED && (!error || result)) {
            throw domain::InvalidTransitionError("FAILED requires an error and no result: " + jobId);
        }
        if (newState != domain::JobState::SUCCEEDED && newState != domain::JobState::FAILED &&
            (result || error)) {
            throw domain::InvalidTransitionError(
                domain::toString(newState) + " carries neither result nor error: " + jobId);
        }

        bool found = jobs_.update(jobId, [&](domain::JobRecord& record) {
            if (!domain::canTransition(record.state, newState)) {
                throw domain::InvalidTransitionError(
                    "Illegal transition " + domain::toString(record.state) + " -> " +
                    domain::toString(newState) + " for job " + jobId);
            }
            record.state = newState;
            record.result = result;
            record.error = error;
            record.updatedAt = domain::Timestamp::now();
        });
        if (!found) {
            throw domain::NotFoundError(jobId);
        }
    }

    int recordDeliveryAttempt(const std::string& jobId) override {
        int attempts = 0;
        bool found = jobs_.update(jobId, [&attempts](domain::JobRecord& record) {
            attempts = ++record.deliveryAttempts;
            record.updatedAt = domain::Timestamp::now();
        });
        if (!found) {
            throw domain::NotFoundError(jobId);
        }
        return attempts;
    }

    void recordDeliveryOutcome(const std::string& jobId, domain::DeliveryStatus status) override {
        bool found = jobs_.update(jobId, [status](domain::JobRecord& record) {
            record.deliveryStatus = status;
            record.updatedAt = domain::Timestamp::now();
        });
        if (!found) {
            throw domain::NotFoundError(jobId);
        }
    }

    std::size_t evict(const std::function<bool(const domain::JobRecord&)>& predicate) override {
        auto removed = jobs_.eraseIf(predicate);
        if (removed > 0) {
            std::cout << "[InMemoryJobRepository] Evicted " << removed << " job(s)" << std::endl;
        }
        return removed;
    }

    std::size_t size() const {
        return jobs_.size();
    }

private:
    ThreadSafeMap<std::string, domain::JobRecord> jobs_;
};

} // namespace jobhook::adapters::secondary
