#pragma once

#include "ICommand.hpp"
#include "ThreadSafeQueue.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @file WorkerPool.hpp
 * @brief Фиксированный пул потоков поверх ThreadSafeQueue
 * @details
 * Команды выполняются вне потока, который их отправил. Исключение из
 * execute() логируется и не останавливает воркер. stop() закрывает очередь,
 * дожидается выполнения уже принятых команд и присоединяет потоки.
 */
class WorkerPool {
public:
    WorkerPool(std::size_t threadCount, std::size_t queueCapacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();
    void stop();

    /**
     * @brief Поставить команду в очередь (не блокирует)
     * @return false, если пул не запущен, остановлен или очередь заполнена
     */
    bool submit(std::shared_ptr<ICommand> command);

    bool isRunning() const { return running_; }
    std::size_t threadCount() const { return threadCount_; }
    std::size_t pending() const { return queue_.size(); }
    uint64_t completedCount() const { return completed_; }
    uint64_t failedCount() const { return failed_; }

private:
    void workerLoop(std::size_t index);

    std::size_t threadCount_;
    ThreadSafeQueue queue_;
    std::vector<std::thread> workers_;
    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
};
