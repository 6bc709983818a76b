#pragma once

#include "domain/JobError.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace jobhook::domain {

/**
 * @brief Тело исходящего callback'а
 *
 * serialize() даёт каноническую форму: компактный JSON с ключами в
 * лексикографическом порядке. Подпись считается ровно по этим байтам.
 */
struct CallbackEnvelope {
    std::string jobId;
    std::optional<nlohmann::json> result;
    std::optional<JobError> error;
    Timestamp timestamp;

    bool succeeded() const { return result.has_value(); }

    std::string serialize() const {
        nlohmann::json j;
        j["job_id"] = jobId;
        j["status"] = succeeded() ? "completed" : "failed";
        if (result) {
            j["result"] = *result;
            j["message"] = "Job analysis completed successfully";
        }
        if (error) {
            j["error"] = {{"code", error->code}, {"message", error->message}};
            j["message"] = "Job analysis failed";
        }
        j["timestamp"] = timestamp.toString();
        return j.dump();
    }
};

} // namespace jobhook::domain
