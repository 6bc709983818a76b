#include <gtest/gtest.h>

#include "application/AnalysisExecutor.hpp"
#include "../mocks/FakeAnalysisGateway.hpp"
#include "../mocks/MockSettings.hpp"

#include <chrono>
#include <thread>

using namespace jobhook;
using namespace jobhook::application;
using namespace jobhook::tests;
using domain::AnalysisErrorKind;

class AnalysisExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway_ = std::make_shared<FakeAnalysisGateway>();
        settings_ = std::make_shared<MockAnalysisClientSettings>();
        settings_->timeout = std::chrono::milliseconds(200);
        executor_ = std::make_shared<AnalysisExecutor>(gateway_, settings_);
    }

    std::shared_ptr<FakeAnalysisGateway> gateway_;
    std::shared_ptr<MockAnalysisClientSettings> settings_;
    std::shared_ptr<AnalysisExecutor> executor_;
};

TEST_F(AnalysisExecutorTest, Success_ReturnsGatewayResult) {
    gateway_->outcome = domain::AnalysisOutcome::ok({{"fit", "good"}});

    auto outcome = executor_->analyze("https://jobs.example/1");

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.result["fit"], "good");
    EXPECT_EQ(gateway_->calls, 1);
    EXPECT_EQ(gateway_->lastUrl, "https://jobs.example/1");
}

TEST_F(AnalysisExecutorTest, GatewayFailure_PassedThrough) {
    gateway_->outcome = domain::AnalysisOutcome::failure(AnalysisErrorKind::UPSTREAM_UNAVAILABLE, "down");

    auto outcome = executor_->analyze("https://x");

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, AnalysisErrorKind::UPSTREAM_UNAVAILABLE);
    EXPECT_EQ(outcome.message, "down");
}

TEST_F(AnalysisExecutorTest, GatewayThrows_Unavailable) {
    gateway_->throwError = true;

    auto outcome = executor_->analyze("https://x");

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, AnalysisErrorKind::UPSTREAM_UNAVAILABLE);
}

TEST_F(AnalysisExecutorTest, SlowGateway_TimesOut) {
    gateway_->delayMs = 600;

    auto started = std::chrono::steady_clock::now();
    auto outcome = executor_->analyze("https://x");
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, AnalysisErrorKind::UPSTREAM_TIMEOUT);
    EXPECT_LT(elapsed, std::chrono::milliseconds(550));
}

TEST_F(AnalysisExecutorTest, UntypedFailure_BecomesInvalidResponse) {
    gateway_->outcome = domain::AnalysisOutcome::failure(AnalysisErrorKind::NONE, "???");

    auto outcome = executor_->analyze("https://x");

    EXPECT_EQ(outcome.errorKind, AnalysisErrorKind::UPSTREAM_INVALID_RESPONSE);
}

TEST_F(AnalysisExecutorTest, AllSlotsBusy_ReturnsUnavailableWithoutCallingGateway) {
    settings_->maxInFlight = 2;
    settings_->timeout = std::chrono::milliseconds(20);
    executor_ = std::make_shared<AnalysisExecutor>(gateway_, settings_);
    gateway_->delayMs = 400;

    EXPECT_EQ(executor_->analyze("https://x/1").errorKind, AnalysisErrorKind::UPSTREAM_TIMEOUT);
    EXPECT_EQ(executor_->analyze("https://x/2").errorKind, AnalysisErrorKind::UPSTREAM_TIMEOUT);
    EXPECT_EQ(executor_->inFlight(), 2u);

    auto outcome = executor_->analyze("https://x/3");

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, AnalysisErrorKind::UPSTREAM_UNAVAILABLE);
    EXPECT_EQ(outcome.message, "Analysis capacity exhausted");
    EXPECT_EQ(gateway_->calls, 2);
}

TEST_F(AnalysisExecutorTest, SlotFreedAfterLateCallFinishes) {
    settings_->maxInFlight = 1;
    settings_->timeout = std::chrono::milliseconds(20);
    executor_ = std::make_shared<AnalysisExecutor>(gateway_, settings_);
    gateway_->delayMs = 150;

    EXPECT_EQ(executor_->analyze("https://x/1").errorKind, AnalysisErrorKind::UPSTREAM_TIMEOUT);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (executor_->inFlight() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_EQ(executor_->inFlight(), 0u);

    gateway_->delayMs = 0;
    EXPECT_TRUE(executor_->analyze("https://x/2").success);
}

TEST_F(AnalysisExecutorTest, Stop_WaitsForOutstandingCallsAndRejectsNewOnes) {
    settings_->timeout = std::chrono::milliseconds(20);
    executor_ = std::make_shared<AnalysisExecutor>(gateway_, settings_);
    gateway_->delayMs = 100;

    EXPECT_EQ(executor_->analyze("https://x/1").errorKind, AnalysisErrorKind::UPSTREAM_TIMEOUT);

    executor_->stop();

    EXPECT_EQ(executor_->inFlight(), 0u);
    auto outcome = executor_->analyze("https://x/2");
    EXPECT_EQ(outcome.errorKind, AnalysisErrorKind::UPSTREAM_UNAVAILABLE);
    EXPECT_EQ(gateway_->calls, 1);
}
