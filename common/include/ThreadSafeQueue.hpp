#pragma once

#include "ICommand.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <cstddef>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Ограниченная потокобезопасная очередь команд
 * @details
 * push() никогда не блокируется: при переполнении или после shutdown()
 * команда отклоняется. pop() блокируется до появления команды; после
 * shutdown() очередь отдаёт оставшиеся команды и только затем nullptr.
 */
class ThreadSafeQueue {
private:
    std::queue<std::shared_ptr<ICommand>> queue_;  ///< Внутренняя очередь
    mutable std::mutex mutex_;                     ///< Мьютекс для синхронизации
    std::condition_variable condVar_;              ///< Условная переменная для ожидания
    std::size_t capacity_;                         ///< 0: без ограничения
    bool shutdown_ = false;                        ///< Флаг завершения работы очереди

public:
    explicit ThreadSafeQueue(std::size_t capacity = 0);
    ~ThreadSafeQueue();

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Добавить команду в очередь
     * @return false, если команда пустая, очередь заполнена или закрыта
     */
    bool push(std::shared_ptr<ICommand> command);

    /**
     * @brief Извлечь команду из очереди (блокирующий вызов)
     * @return команда, либо nullptr, если очередь закрыта и пуста
     */
    std::shared_ptr<ICommand> pop();

    /**
     * @brief Закрыть очередь и пробудить все ожидающие потоки
     */
    void shutdown();

    bool isShutdown() const;

    bool isEmpty() const;

    std::size_t size() const;

    std::size_t capacity() const { return capacity_; }
};
