/**
 * @file AsyncJobFlowTest.cpp
 * @brief Полный async сценарий на настоящем пуле воркеров:
 *        webhook -> 202 -> анализ в фоне -> подписанный callback
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/WebhookDispatcher.hpp"
#include "application/AnalysisExecutor.hpp"
#include "application/CallbackDeliveryClient.hpp"
#include "application/MetricsService.hpp"
#include "adapters/secondary/HmacSha256SignatureCodec.hpp"
#include "adapters/secondary/InMemoryJobRepository.hpp"
#include "adapters/secondary/WorkerPoolJobScheduler.hpp"
#include "settings/MetricsSettings.hpp"
#include "../mocks/FakeAnalysisGateway.hpp"
#include "../mocks/MockHttpClient.hpp"
#include "../mocks/MockSettings.hpp"

#include <chrono>
#include <future>

using namespace jobhook;
using namespace jobhook::tests;
using ::testing::_;

class AsyncJobFlowTest : public ::testing::Test {
protected:
    void SetUp() override {
        codec_ = std::make_shared<adapters::secondary::HmacSha256SignatureCodec>();
        jobs_ = std::make_shared<adapters::secondary::InMemoryJobRepository>();
        gateway_ = std::make_shared<FakeAnalysisGateway>();
        httpClient_ = std::make_shared<MockHttpClient>();
        metrics_ = std::make_shared<application::MetricsService>(
            std::make_shared<settings::MetricsSettings>());

        auto executor = std::make_shared<application::AnalysisExecutor>(
            gateway_, std::make_shared<MockAnalysisClientSettings>());
        auto delivery = std::make_shared<application::CallbackDeliveryClient>(
            httpClient_, codec_, jobs_, std::make_shared<MockCallbackSettings>(), metrics_);

        scheduler_ = std::make_shared<adapters::secondary::WorkerPoolJobScheduler>(
            std::make_shared<settings::WorkerPoolSettings>());
        scheduler_->start();

        dispatcher_ = std::make_shared<application::WebhookDispatcher>(
            codec_, jobs_, executor, scheduler_, delivery,
            std::make_shared<MockWebhookSettings>("s"), metrics_);
    }

    void TearDown() override {
        scheduler_->stop();
    }

    std::shared_ptr<adapters::secondary::HmacSha256SignatureCodec> codec_;
    std::shared_ptr<adapters::secondary::InMemoryJobRepository> jobs_;
    std::shared_ptr<FakeAnalysisGateway> gateway_;
    std::shared_ptr<MockHttpClient> httpClient_;
    std::shared_ptr<application::MetricsService> metrics_;
    std::shared_ptr<adapters::secondary::WorkerPoolJobScheduler> scheduler_;
    std::shared_ptr<application::WebhookDispatcher> dispatcher_;
};

TEST_F(AsyncJobFlowTest, AcceptedJob_DeliversVerifiableCallback) {
    gateway_->outcome = domain::AnalysisOutcome::ok({{"match", 0.75}});

    std::promise<SimpleRequest> callbackSent;
    auto callbackFuture = callbackSent.get_future();
    EXPECT_CALL(*httpClient_, send(_, _))
        .WillOnce([&callbackSent](const IRequest& req, IResponse& res) {
            callbackSent.set_value(copyRequest(req));
            return respond(res, 200);
        });

    const std::string body =
        R"({"job_id":"j2","url":"https://jobs.example/2","async_processing":true,"callback_url":"https://cb"})";
    auto result = dispatcher_->handleWebhook(body, codec_->headerValue("s", body));

    ASSERT_EQ(result.status, domain::DispatchStatus::ACCEPTED);

    ASSERT_EQ(callbackFuture.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto sent = callbackFuture.get();

    auto signature = sent.getHeader("X-Webhook-Signature");
    ASSERT_TRUE(signature.has_value());
    EXPECT_TRUE(codec_->verify("s", sent.getBody(), *signature));

    auto envelope = nlohmann::json::parse(sent.getBody());
    EXPECT_EQ(envelope["job_id"], "j2");
    EXPECT_EQ(envelope["status"], "completed");
    EXPECT_EQ(envelope["result"]["match"], 0.75);

    // stop() дожидается выполнения уже принятых команд
    scheduler_->stop();
    auto record = jobs_->get("j2");
    EXPECT_EQ(record.state, domain::JobState::SUCCEEDED);
    EXPECT_EQ(record.deliveryStatus, domain::DeliveryStatus::DELIVERED);
    EXPECT_EQ(record.deliveryAttempts, 1);
}

TEST_F(AsyncJobFlowTest, ManyJobs_AllReachTerminalState) {
    EXPECT_CALL(*httpClient_, send(_, _))
        .WillRepeatedly([](const IRequest& req, IResponse& res) { return respond(res, 200); });

    const int JOBS = 20;
    for (int i = 0; i < JOBS; ++i) {
        std::string body = R"({"job_id":"job-)" + std::to_string(i) +
                            R"(","url":"https://x","callback_url":"https://cb"})";
        ASSERT_EQ(dispatcher_->handleWebhook(body, codec_->headerValue("s", body)).status,
                  domain::DispatchStatus::ACCEPTED);
    }

    scheduler_->stop();

    for (int i = 0; i < JOBS; ++i) {
        auto record = jobs_->get("job-" + std::to_string(i));
        EXPECT_EQ(record.state, domain::JobState::SUCCEEDED);
        EXPECT_EQ(record.deliveryStatus, domain::DeliveryStatus::DELIVERED);
    }
    EXPECT_EQ(metrics_->value("callbacks_delivered_total"), JOBS);
}
