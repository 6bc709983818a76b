#pragma once

#include <ICommand.hpp>
#include <memory>

namespace jobhook::ports::output {

/**
 * @brief Фоновое выполнение команд вне цикла запрос/ответ
 */
class IJobScheduler {
public:
    virtual ~IJobScheduler() = default;

    /**
     * @return false, если команда не принята (очередь заполнена или остановлена)
     */
    virtual bool schedule(std::shared_ptr<ICommand> command) = 0;
};

} // namespace jobhook::ports::output
