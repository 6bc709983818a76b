#include <gtest/gtest.h>

#include "application/AnalysisJobCommand.hpp"
#include "adapters/secondary/InMemoryJobRepository.hpp"
#include "../mocks/FakeAnalysisExecutor.hpp"

#include <vector>

using namespace jobhook;
using namespace jobhook::application;
using namespace jobhook::tests;

class AnalysisJobCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        jobs_ = std::make_shared<adapters::secondary::InMemoryJobRepository>();
        executor_ = std::make_shared<FakeAnalysisExecutor>();
    }

    std::shared_ptr<AnalysisJobCommand> makeCommand(const std::string& jobId) {
        return std::make_shared<AnalysisJobCommand>(
            jobId, "https://x", jobs_, executor_,
            [this](const std::string& id, const domain::AnalysisOutcome& outcome) {
                completedIds_.push_back(id);
                stateAtCompletion_ = jobs_->get(id).state;
            });
    }

    std::shared_ptr<adapters::secondary::InMemoryJobRepository> jobs_;
    std::shared_ptr<FakeAnalysisExecutor> executor_;
    std::vector<std::string> completedIds_;
    domain::JobState stateAtCompletion_ = domain::JobState::RECEIVED;
};

TEST_F(AnalysisJobCommandTest, Execute_MarksExecutingAndReportsOutcome) {
    jobs_->create("j1", std::string("https://cb"));

    makeCommand("j1")->execute();

    EXPECT_EQ(executor_->calls, 1);
    ASSERT_EQ(completedIds_.size(), 1u);
    EXPECT_EQ(completedIds_[0], "j1");
    EXPECT_EQ(stateAtCompletion_, domain::JobState::EXECUTING);
}

TEST_F(AnalysisJobCommandTest, Execute_EvictedJob_SkipsAnalysis) {
    makeCommand("gone")->execute();

    EXPECT_EQ(executor_->calls, 0);
    EXPECT_TRUE(completedIds_.empty());
}

TEST_F(AnalysisJobCommandTest, Name_IsStable) {
    EXPECT_STREQ(makeCommand("j1")->name(), "AnalysisJobCommand");
    EXPECT_EQ(makeCommand("j1")->jobId(), "j1");
}
