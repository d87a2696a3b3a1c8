#pragma once

#include <string>
#include <map>

namespace ledger::ports::input {

/**
 * @brief Счётчики в формате Prometheus
 *
 * Ключ метрики: name{label1="value1",label2="value2"}, labels в порядке имён.
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /// Prometheus text format 0.0.4
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace ledger::ports::input
