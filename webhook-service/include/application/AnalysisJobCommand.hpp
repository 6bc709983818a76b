#pragma once

#include "ports/input/IAnalysisExecutor.hpp"
#include "ports/output/IJobRepository.hpp"
#include "domain/AnalysisOutcome.hpp"
#include "domain/Errors.hpp"
#include <ICommand.hpp>

#include <functional>
#include <iostream>
#include <memory>
#include <string>

namespace jobhook::application {

/**
 * @brief Фоновое выполнение принятой async задачи
 *
 * ACCEPTED -> EXECUTING, вызов анализатора, передача исхода обработчику
 * завершения диспетчера. Терминальное состояние ставит диспетчер.
 */
class AnalysisJobCommand : public ICommand {
public:
    using CompletionHandler = std::function<void(const std::string&, const domain::AnalysisOutcome&)>;

    AnalysisJobCommand(
        std::string jobId,
        std::string url,
        std::shared_ptr<ports::output::IJobRepository> jobs,
        std::shared_ptr<ports::input::IAnalysisExecutor> executor,
        CompletionHandler onCompleted
    ) : jobId_(std::move(jobId))
      , url_(std::move(url))
      , jobs_(std::move(jobs))
      , executor_(std::move(executor))
      , onCompleted_(std::move(onCompleted))
    {}

    void execute() override {
        try {
            jobs_->transition(jobId_, domain::JobState::EXECUTING);
        } catch (const domain::JobStoreError& e) {
            std::cerr << "[AnalysisJobCommand] " << jobId_ << ": cannot start: " << e.what() << std::endl;
            return;
        }

        std::cout << "[AnalysisJobCommand] " << jobId_ << ": analyzing " << url_ << std::endl;
        auto outcome = executor_->analyze(url_);
        onCompleted_(jobId_, outcome);
    }

    const char* name() const override { return "AnalysisJobCommand"; }

    const std::string& jobId() const { return jobId_; }

private:
    std::string jobId_;
    std::string url_;
    std::shared_ptr<ports::output::IJobRepository> jobs_;
    std::shared_ptr<ports::input::IAnalysisExecutor> executor_;
    CompletionHandler onCompleted_;
};

} // namespace jobhook::application
