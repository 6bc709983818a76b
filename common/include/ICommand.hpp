#pragma once

/**
 * @file ICommand.hpp
 * @brief Единица фоновой работы для WorkerPool
 */

/**
 * @brief Команда, которую воркер извлекает из очереди и выполняет
 *
 * Команда владеет всем, что ей нужно для выполнения (shared_ptr на сервисы),
 * и не зависит от жизненного цикла HTTP запроса, который её создал.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду в потоке воркера
     * @throws std::exception: воркер логирует ошибку и продолжает работу
     */
    virtual void execute() = 0;

    /**
     * @brief Имя команды для логов
     */
    virtual const char* name() const { return "command"; }
};
