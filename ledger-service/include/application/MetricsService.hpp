#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <memory>
#include <string>
#include <sstream>
#include <map>
#include <shared_mutex>
#include <mutex>
#include <atomic>
#include <iostream>

namespace ledger::application {

/**
 * @brief Хранилище счётчиков для /metrics
 *
 * Инкремент существующего ключа идёт под разделяемой блокировкой
 * (atomic fetch_add), новый ключ добавляется под эксклюзивной.
 * Ключи выводятся в лексикографическом порядке.
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& key : settings_->getAllKeys()) {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(0);
        }
        std::cout << "[MetricsService] Initialized with " << counters_.size() << " metrics" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        std::string key = buildKey(name, labels);

        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                it->second->fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto [it, inserted] = counters_.try_emplace(key, nullptr);
        if (inserted) {
            it->second = std::make_unique<std::atomic<int64_t>>(1);
        } else {
            it->second->fetch_add(1, std::memory_order_relaxed);
        }
    }

    std::string toPrometheusFormat() const override {
        std::ostringstream oss;

        for (const auto& def : settings_->getDefinitions()) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [key, value] : counters_) {
            oss << key << " " << value->load(std::memory_order_relaxed) << "\n";
        }
        return oss.str();
    }

private:
    std::shared_ptr<settings::IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::unique_ptr<std::atomic<int64_t>>> counters_;

    static std::string buildKey(
        const std::string& name,
        const std::map<std::string, std::string>& labels
    ) {
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

} // namespace ledger::application
