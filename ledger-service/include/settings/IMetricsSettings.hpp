#pragma once

#include <string>
#include <vector>

namespace ledger::settings {

/**
 * @brief Метаданные метрики для строк HELP и TYPE
 */
struct MetricDefinition {
    std::string name;   ///< "ledger_entries_posted_total"
    std::string help;
    std::string type;   ///< "counter"
};

/**
 * @brief Набор метрик сервиса
 *
 * getAllKeys() перечисляет ключи, которые видны на /metrics с нуля,
 * ещё до первого инкремента.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    virtual std::vector<MetricDefinition> getDefinitions() const = 0;
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace ledger::settings
