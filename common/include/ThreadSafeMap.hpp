#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <cstddef>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасная map со значениями-снимками
 * @details
 * Значения хранятся как std::shared_ptr<V>. update() работает по принципу
 * copy-on-write: читатель, получивший указатель через find(), видит
 * неизменный снимок, даже если запись параллельно обновляется.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @brief Вставить значение, только если ключа ещё нет
     * @return false, если ключ уже существует (значение не меняется)
     */
    bool insertIfAbsent(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Атомарно изменить значение по ключу
     *
     * fn получает копию текущего значения; копия заменяет оригинал только
     * если fn завершилась без исключения. Все update() по карте
     * сериализуются эксклюзивной блокировкой.
     *
     * @return false, если ключа нет
     */
    template <typename Fn>
    bool update(const K &key, Fn &&fn)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end())
            return false;

        auto copy = std::make_shared<V>(*it->second);
        fn(*copy);
        it->second = std::move(copy);
        return true;
    }

    /**
     * @brief Удалить все записи, для которых pred(const V&) == true
     * @return Количество удалённых записей
     */
    template <typename Pred>
    std::size_t eraseIf(Pred &&pred)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        std::size_t removed = 0;
        for (auto it = map_.begin(); it != map_.end();)
        {
            if (pred(static_cast<const V &>(*it->second)))
            {
                it = map_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    std::size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
