#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace ledger::settings {

/**
 * @brief Метрики ledger-service
 *
 * - HTTP: запросы по методу и нормализованному пути
 * - Ошибки ядра по коду (ledger_errors_total{code="UNBALANCED"})
 * - Бизнес-счётчики проводок, периодов и годов
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"ledger_errors_total", "Ledger operations rejected, by error code", "counter"},
            {"ledger_entries_posted_total", "Journal entries posted", "counter"},
            {"ledger_entries_reversed_total", "Journal entries reversed", "counter"},
            {"ledger_periods_closed_total", "Accounting periods closed", "counter"},
            {"ledger_fiscal_years_closed_total", "Fiscal years closed", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            "ledger_entries_posted_total",
            "ledger_entries_reversed_total",
            "ledger_periods_closed_total",
            "ledger_fiscal_years_closed_total"
        };
    }
};

} // namespace ledger::settings
