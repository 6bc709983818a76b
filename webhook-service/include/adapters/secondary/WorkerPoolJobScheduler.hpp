#pragma once

#include "ports/output/IJobScheduler.hpp"
#include "settings/WorkerPoolSettings.hpp"
#include <WorkerPool.hpp>
#include <iostream>
#include <memory>

namespace jobhook::adapters::secondary {

/**
 * @brief IJobScheduler поверх общего WorkerPool
 *
 * Пул запускается явно (start) после сборки приложения и
 * останавливается в stop() или деструкторе; принятые команды дорабатывают.
 */
class WorkerPoolJobScheduler : public ports::output::IJobScheduler {
public:
    explicit WorkerPoolJobScheduler(std::shared_ptr<settings::WorkerPoolSettings> settings)
        : pool_(settings->getThreads(), settings->getQueueCapacity())
    {
        std::cout << "[WorkerPoolJobScheduler] Created" << std::endl;
    }

    bool schedule(std::shared_ptr<ICommand> command) override {
        bool accepted = pool_.submit(std::move(command));
        if (!accepted) {
            std::cerr << "[WorkerPoolJobScheduler] Command rejected (pending: "
                      << pool_.pending() << ")" << std::endl;
        }
        return accepted;
    }

    void start() { pool_.start(); }
    void stop() { pool_.stop(); }

private:
    WorkerPool pool_;
};

} // namespace jobhook::adapters::secondary
