/**
 * @file JobAnalysisWebhookHandlerTest.cpp
 * @brief Маппинг DispatchResult -> HTTP ответ
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "adapters/primary/JobAnalysisWebhookHandler.hpp"
#include "../mocks/MockWebhookDispatcher.hpp"
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace jobhook;
using namespace jobhook::adapters::primary;
using namespace jobhook::tests;
using domain::DispatchStatus;
using ::testing::_;
using ::testing::Eq;
using ::testing::Return;
using json = nlohmann::json;

class JobAnalysisWebhookHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dispatcher_ = std::make_shared<MockWebhookDispatcher>();
        handler_ = std::make_shared<JobAnalysisWebhookHandler>(dispatcher_);
    }

    SimpleRequest createRequest(
        const std::string& method,
        const std::string& body = "{}",
        const std::string& signature = "sha256=abc"
    ) {
        std::map<std::string, std::string> headers;
        headers["Content-Type"] = "application/json";
        if (!signature.empty()) {
            headers["X-Webhook-Signature"] = signature;
        }
        return SimpleRequest(method, "/api/v1/webhooks/job-analysis", body, "127.0.0.1", 8080, headers);
    }

    domain::DispatchResult resultWith(DispatchStatus status) {
        domain::DispatchResult result;
        result.status = status;
        result.jobId = "j1";
        return result;
    }

    json respondTo(const domain::DispatchResult& result, SimpleResponse& res) {
        EXPECT_CALL(*dispatcher_, handleWebhook(_, _)).WillOnce(Return(result));
        auto req = createRequest("POST");
        handler_->handle(req, res);
        return json::parse(res.getBody());
    }

    std::shared_ptr<MockWebhookDispatcher> dispatcher_;
    std::shared_ptr<JobAnalysisWebhookHandler> handler_;
};

TEST_F(JobAnalysisWebhookHandlerTest, PassesRawBodyAndSignature) {
    const std::string body = R"({"job_id":"j1" , "url":"https://x"})";
    EXPECT_CALL(*dispatcher_, handleWebhook(Eq(body), Eq(std::optional<std::string>("sha256=ff"))))
        .WillOnce(Return(resultWith(DispatchStatus::UNAUTHORIZED)));

    auto req = createRequest("POST", body, "sha256=ff");
    SimpleResponse res;
    handler_->handle(req, res);
}

TEST_F(JobAnalysisWebhookHandlerTest, NoSignatureHeader_PassesNullopt) {
    EXPECT_CALL(*dispatcher_, handleWebhook(_, Eq(std::optional<std::string>())))
        .WillOnce(Return(resultWith(DispatchStatus::UNAUTHORIZED)));

    auto req = createRequest("POST", "{}", "");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
}

TEST_F(JobAnalysisWebhookHandlerTest, GetMethod_Returns405) {
    EXPECT_CALL(*dispatcher_, handleWebhook(_, _)).Times(0);

    auto req = createRequest("GET");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

TEST_F(JobAnalysisWebhookHandlerTest, Completed_Returns200WithResult) {
    auto result = resultWith(DispatchStatus::COMPLETED);
    result.result = {{"score", 0.9}};
    result.message = "Job analysis completed successfully";
    SimpleResponse res;

    auto body = respondTo(result, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(body["status"], "completed");
    EXPECT_EQ(body["job_id"], "j1");
    EXPECT_EQ(body["result"]["score"], 0.9);
    EXPECT_TRUE(body.contains("timestamp"));
}

TEST_F(JobAnalysisWebhookHandlerTest, Accepted_Returns202) {
    SimpleResponse res;

    auto body = respondTo(resultWith(DispatchStatus::ACCEPTED), res);

    EXPECT_EQ(res.getStatus(), 202);
    EXPECT_EQ(body["status"], "accepted");
    EXPECT_EQ(body["job_id"], "j1");
    EXPECT_FALSE(body.contains("result"));
}

TEST_F(JobAnalysisWebhookHandlerTest, Unauthorized_Returns401) {
    SimpleResponse res;

    auto body = respondTo(resultWith(DispatchStatus::UNAUTHORIZED), res);

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_EQ(body["error"], "Unauthorized");
}

TEST_F(JobAnalysisWebhookHandlerTest, BadRequest_Returns422Generic) {
    SimpleResponse res;

    auto body = respondTo(resultWith(DispatchStatus::BAD_REQUEST), res);

    EXPECT_EQ(res.getStatus(), 422);
    EXPECT_EQ(body, json({{"error", "Invalid request"}}));
}

TEST_F(JobAnalysisWebhookHandlerTest, Conflict_Returns409) {
    SimpleResponse res;

    auto body = respondTo(resultWith(DispatchStatus::CONFLICT), res);

    EXPECT_EQ(res.getStatus(), 409);
    EXPECT_EQ(body["job_id"], "j1");
}

TEST_F(JobAnalysisWebhookHandlerTest, PayloadTooLarge_Returns413) {
    SimpleResponse res;

    respondTo(resultWith(DispatchStatus::PAYLOAD_TOO_LARGE), res);

    EXPECT_EQ(res.getStatus(), 413);
}

TEST_F(JobAnalysisWebhookHandlerTest, UpstreamUnavailable_Returns502) {
    auto result = resultWith(DispatchStatus::UPSTREAM_FAILED);
    result.errorKind = domain::AnalysisErrorKind::UPSTREAM_UNAVAILABLE;
    result.message = "down";
    SimpleResponse res;

    auto body = respondTo(result, res);

    EXPECT_EQ(res.getStatus(), 502);
    EXPECT_EQ(body["code"], "UPSTREAM_UNAVAILABLE");
    EXPECT_EQ(body["error"], "down");
}

TEST_F(JobAnalysisWebhookHandlerTest, UpstreamTimeout_Returns504) {
    auto result = resultWith(DispatchStatus::UPSTREAM_FAILED);
    result.errorKind = domain::AnalysisErrorKind::UPSTREAM_TIMEOUT;
    SimpleResponse res;

    auto body = respondTo(result, res);

    EXPECT_EQ(res.getStatus(), 504);
    EXPECT_EQ(body["code"], "UPSTREAM_TIMEOUT");
}

TEST_F(JobAnalysisWebhookHandlerTest, ServiceUnavailable_Returns503) {
    SimpleResponse res;

    respondTo(resultWith(DispatchStatus::SERVICE_UNAVAILABLE), res);

    EXPECT_EQ(res.getStatus(), 503);
}

TEST_F(JobAnalysisWebhookHandlerTest, DispatcherThrows_Returns500) {
    EXPECT_CALL(*dispatcher_, handleWebhook(_, _))
        .WillOnce(::testing::Throw(std::runtime_error("boom")));

    auto req = createRequest("POST");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
    EXPECT_EQ(json::parse(res.getBody())["error"], "Internal server error");
}
