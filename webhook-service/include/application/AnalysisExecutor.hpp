#pragma once

#include "ICommand.hpp"
#include "WorkerPool.hpp"
#include "ports/input/IAnalysisExecutor.hpp"
#include "ports/output/IAnalysisGateway.hpp"
#include "settings/IAnalysisClientSettings.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <iostream>
#include <memory>
#include <string>

namespace jobhook::application {

/**
 * @brief Один вызов шлюза анализа в пуле исполнителя
 *
 * Результат или исключение уходят в promise. Счётчик занятых слотов
 * уменьшается после вызова, даже если ожидающий уже ушёл по таймауту.
 */
class AnalysisCallCommand : public ICommand {
public:
    AnalysisCallCommand(
        std::shared_ptr<ports::output::IAnalysisGateway> gateway,
        std::string url,
        std::shared_ptr<std::promise<domain::AnalysisOutcome>> promise,
        std::atomic<std::size_t>& inFlight
    ) : gateway_(std::move(gateway))
      , url_(std::move(url))
      , promise_(std::move(promise))
      , inFlight_(inFlight)
    {}

    void execute() override {
        try {
            promise_->set_value(gateway_->analyze(url_));
        } catch (const std::exception& e) {
            promise_->set_value(domain::AnalysisOutcome::failure(
                domain::AnalysisErrorKind::UPSTREAM_UNAVAILABLE,
                std::string("Analysis call failed: ") + e.what()));
        }
        --inFlight_;
    }

    const char* name() const override { return "AnalysisCall"; }

private:
    std::shared_ptr<ports::output::IAnalysisGateway> gateway_;
    std::string url_;
    std::shared_ptr<std::promise<domain::AnalysisOutcome>> promise_;
    std::atomic<std::size_t>& inFlight_;
};

/**
 * @brief Вызов внешнего анализатора с ограничением по времени
 *
 * Вызовы шлюза выполняются в собственном пуле на getMaxInFlight() потоков.
 * Не уложившийся в таймаут вызов возвращает UPSTREAM_TIMEOUT, но продолжает
 * занимать слот до своего завершения; поздний результат отбрасывается.
 * Когда все слоты заняты, новый вызов сразу получает UPSTREAM_UNAVAILABLE.
 *
 * stop() закрывает приём и дожидается уже начатых вызовов.
 */
class AnalysisExecutor : public ports::input::IAnalysisExecutor {
public:
    AnalysisExecutor(
        std::shared_ptr<ports::output::IAnalysisGateway> gateway,
        std::shared_ptr<settings::IAnalysisClientSettings> settings
    ) : gateway_(std::move(gateway))
      , settings_(std::move(settings))
      , maxInFlight_(settings_->getMaxInFlight() == 0 ? 1 : settings_->getMaxInFlight())
      , calls_(maxInFlight_, maxInFlight_)
    {
        calls_.start();
        std::cout << "[AnalysisExecutor] Created, timeout: "
                  << settings_->getTimeout().count() << "ms, max in flight: "
                  << maxInFlight_ << std::endl;
    }

    ~AnalysisExecutor() override {
        stop();
    }

    domain::AnalysisOutcome analyze(const std::string& url) override {
        if (inFlight_.fetch_add(1) >= maxInFlight_) {
            --inFlight_;
            std::cerr << "[AnalysisExecutor] All " << maxInFlight_
                      << " upstream slots busy, rejecting " << url << std::endl;
            return domain::AnalysisOutcome::failure(
                domain::AnalysisErrorKind::UPSTREAM_UNAVAILABLE,
                "Analysis capacity exhausted");
        }

        auto promise = std::make_shared<std::promise<domain::AnalysisOutcome>>();
        auto future = promise->get_future();

        if (!calls_.submit(std::make_shared<AnalysisCallCommand>(gateway_, url, promise, inFlight_))) {
            --inFlight_;
            std::cerr << "[AnalysisExecutor] Executor stopped, rejecting " << url << std::endl;
            return domain::AnalysisOutcome::failure(
                domain::AnalysisErrorKind::UPSTREAM_UNAVAILABLE,
                "Analysis call could not be started");
        }

        auto timeout = settings_->getTimeout();
        if (future.wait_for(timeout) != std::future_status::ready) {
            std::cerr << "[AnalysisExecutor] Timeout after " << timeout.count()
                      << "ms for " << url << std::endl;
            return domain::AnalysisOutcome::failure(
                domain::AnalysisErrorKind::UPSTREAM_TIMEOUT,
                "Analysis did not finish within " + std::to_string(timeout.count()) + "ms");
        }

        auto outcome = future.get();
        if (!outcome.success && outcome.errorKind == domain::AnalysisErrorKind::NONE) {
            outcome.errorKind = domain::AnalysisErrorKind::UPSTREAM_INVALID_RESPONSE;
        }
        return outcome;
    }

    /**
     * @brief Прекратить приём вызовов и дождаться начатых
     */
    void stop() {
        if (auto outstanding = inFlight_.load()) {
            std::cout << "[AnalysisExecutor] Waiting for " << outstanding
                      << " upstream call(s)" << std::endl;
        }
        calls_.stop();
    }

    std::size_t inFlight() const { return inFlight_; }
    std::size_t maxInFlight() const { return maxInFlight_; }

private:
    std::shared_ptr<ports::output::IAnalysisGateway> gateway_;
    std::shared_ptr<settings::IAnalysisClientSettings> settings_;
    std::size_t maxInFlight_;
    std::atomic<std::size_t> inFlight_{0};
    WorkerPool calls_;
};

} // namespace jobhook::application
