#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include <nlohmann/json.hpp>

namespace jobhook::adapters::primary {

class RootHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["message"] = "Welcome to the Job Analysis API";

        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace jobhook::adapters::primary
