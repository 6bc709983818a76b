#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <memory>
#include <string>
#include <sstream>
#include <map>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <atomic>
#include <iostream>

namespace jobhook::application {

/**
 * @brief Сервис сбора и хранения метрик
 *
 * Счётчики из MetricsSettings создаются заранее с нулём, чтобы /metrics
 * показывал их до первого события. Новые ключи заводятся под unique_lock,
 * инкремент существующих идёт под shared_lock через atomic.
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& key : settings_->getAllKeys()) {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(0);
        }

        std::cout << "[MetricsService] Initialized with "
                  << counters_.size() << " metrics" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        std::string key = buildKey(name, labels);

        // Fast path: ключ уже существует
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                it->second->fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }

        // Slow path: создаём новый ключ
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                it->second->fetch_add(1, std::memory_order_relaxed);
            } else {
                counters_[key] = std::make_unique<std::atomic<int64_t>>(1);
            }
        }
    }

    long long value(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(buildKey(name, labels));
        return it != counters_.end() ? it->second->load(std::memory_order_relaxed) : 0;
    }

    /**
     * @brief Каждая метрика: HELP, TYPE и следом её серии
     *
     * Экспортируются только ключи из IMetricsSettings::getAllKeys().
     */
    std::string toPrometheusFormat() const override {
        std::ostringstream oss;
        auto keys = settings_->getAllKeys();

        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& def : settings_->getDefinitions()) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";

            for (const auto& key : keys) {
                if (metricName(key) != def.name) {
                    continue;
                }
                auto it = counters_.find(key);
                if (it != counters_.end()) {
                    oss << key << " " << it->second->load(std::memory_order_relaxed) << "\n";
                }
            }
        }

        return oss.str();
    }

private:
    std::shared_ptr<settings::IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::atomic<int64_t>>> counters_;

    static std::string metricName(const std::string& key) {
        return key.substr(0, key.find('{'));
    }

    std::string buildKey(
        const std::string& name,
        const std::map<std::string, std::string>& labels
    ) const {
        if (labels.empty()) {
            return name;
        }

        std::ostringstream oss;
        oss << name << "{";
        bool first = true;
        for (const auto& [k, v] : labels) {
            if (!first) oss << ",";
            oss << k << "=\"" << v << "\"";
            first = false;
        }
        oss << "}";
        return oss.str();
    }
};

} // namespace jobhook::application
