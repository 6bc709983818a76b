#pragma once

#include <cstdlib>
#include <cstddef>
#include <string>

namespace jobhook::settings {

/**
 * @brief Размер пула фоновых воркеров и его очереди
 */
class WorkerPoolSettings {
public:
    WorkerPoolSettings() {
        if (const char* threads = std::getenv("WORKER_THREADS")) {
            threads_ = static_cast<std::size_t>(std::stoul(threads));
        }
        if (const char* capacity = std::getenv("WORKER_QUEUE_CAPACITY")) {
            queueCapacity_ = static_cast<std::size_t>(std::stoul(capacity));
        }
    }

    std::size_t getThreads() const { return threads_; }
    std::size_t getQueueCapacity() const { return queueCapacity_; }

private:
    std::size_t threads_ = 4;
    std::size_t queueCapacity_ = 256;
};

} // namespace jobhook::settings
