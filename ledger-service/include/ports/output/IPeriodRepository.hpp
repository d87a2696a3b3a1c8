#pragma once

#include "domain/FiscalYear.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Хранилище финансовых годов и их периодов
 */
class IPeriodRepository {
public:
    virtual ~IPeriodRepository() = default;

    /// Сохраняет год вместе со всеми периодами (upsert)
    virtual domain::FiscalYear saveFiscalYear(const domain::FiscalYear& year) = 0;
    virtual void savePeriod(const domain::AccountingPeriod& period) = 0;

    virtual std::optional<domain::FiscalYear> findFiscalYear(const std::string& yearId) = 0;
    virtual std::vector<domain::FiscalYear> findAllFiscalYears() = 0;

    virtual std::optional<domain::AccountingPeriod> findPeriod(const std::string& periodId) = 0;
    virtual std::optional<domain::AccountingPeriod> findPeriodByDate(const domain::Date& date) = 0;
};

} // namespace ledger::ports::output
