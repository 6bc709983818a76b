#include "WorkerPool.hpp"

#include <exception>
#include <iostream>

WorkerPool::WorkerPool(std::size_t threadCount, std::size_t queueCapacity)
    : threadCount_(threadCount == 0 ? 1 : threadCount)
    , queue_(queueCapacity)
{}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_ || queue_.isShutdown()) return;

    running_ = true;
    workers_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        workers_.emplace_back([this, i]() { workerLoop(i); });
    }
    std::cout << "[WorkerPool] Started " << threadCount_ << " workers, queue capacity "
              << queue_.capacity() << std::endl;
}

void WorkerPool::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    queue_.shutdown();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    if (running_.exchange(false)) {
        std::cout << "[WorkerPool] Stopped (completed: " << completed_
                  << ", failed: " << failed_ << ")" << std::endl;
    }
}

bool WorkerPool::submit(std::shared_ptr<ICommand> command) {
    if (!running_) {
        return false;
    }
    return queue_.push(std::move(command));
}

void WorkerPool::workerLoop(std::size_t index) {
    while (auto command = queue_.pop()) {
        try {
            command->execute();
            ++completed_;
        } catch (const std::exception& e) {
            ++failed_;
            std::cerr << "[WorkerPool] worker " << index << ": " << command->name()
                      << " failed: " << e.what() << std::endl;
        }
    }
}
