#pragma once

#include "domain/FiscalYear.hpp"
#include "domain/Date.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Запрос на создание финансового года
 *
 * periods пустой: периоды нарезаются помесячно.
 */
struct CreateFiscalYearRequest {
    std::string name;
    domain::Date startDate;
    domain::Date endDate;                   ///< не включительно
    std::vector<domain::DateRange> periods;
};

/**
 * @brief Реестр финансовых годов и периодов
 */
class IPeriodService {
public:
    virtual ~IPeriodService() = default;

    /**
     * @throws domain::LedgerException PARTITION_ERROR
     */
    virtual domain::FiscalYear createFiscalYear(const CreateFiscalYearRequest& request) = 0;

    virtual domain::FiscalYear getFiscalYear(const std::string& yearId) = 0;
    virtual std::vector<domain::FiscalYear> listFiscalYears() = 0;

    virtual domain::AccountingPeriod getPeriod(const std::string& periodId) = 0;
    virtual std::optional<domain::AccountingPeriod> findPeriodForDate(const domain::Date& date) = 0;

    /// Дата внутри открытого периода незакрытого года
    virtual bool isOpenForPosting(const domain::Date& date) = 0;

    /**
     * @throws domain::LedgerException OUT_OF_ORDER, HAS_DRAFT_ENTRIES, INVALID_STATE
     */
    virtual domain::AccountingPeriod closePeriod(const std::string& periodId) = 0;

    virtual domain::AccountingPeriod lockPeriod(const std::string& periodId) = 0;
    virtual domain::AccountingPeriod unlockPeriod(const std::string& periodId) = 0;
};

} // namespace ledger::ports::input
