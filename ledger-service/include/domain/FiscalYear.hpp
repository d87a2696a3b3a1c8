#pragma once

#include "Date.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <optional>

namespace ledger::domain {

/**
 * @brief Учётный период внутри финансового года (обычно месяц)
 *
 * isClosed: формальное закрытие (необратимо).
 * isLocked: аудиторская заморозка, снимается unlock-ом.
 */
struct AccountingPeriod {
    std::string id;             ///< "FY20260101-P01"
    std::string fiscalYearId;
    int periodNumber = 0;       ///< 1..N в календарном порядке
    Date startDate;             ///< включительно
    Date endDate;               ///< не включительно
    bool isClosed = false;
    bool isLocked = false;

    DateRange range() const { return DateRange{startDate, endDate}; }

    bool contains(const Date& date) const { return range().contains(date); }

    bool acceptsPostings() const { return !isClosed && !isLocked; }
};

/**
 * @brief Финансовый год: [startDate, endDate) разбит на периоды без пропусков
 */
struct FiscalYear {
    std::string id;             ///< "FY20260101"
    std::string name;
    Date startDate;
    Date endDate;               ///< не включительно
    bool isClosed = false;
    std::optional<Timestamp> closedAt;
    std::vector<AccountingPeriod> periods;  ///< упорядочены по periodNumber

    DateRange range() const { return DateRange{startDate, endDate}; }

    bool contains(const Date& date) const { return range().contains(date); }

    /// Дата закрывающих проводок
    Date lastDay() const { return range().lastDay(); }

    bool allPeriodsClosed() const {
        for (const auto& period : periods) {
            if (!period.isClosed) return false;
        }
        return true;
    }

    const AccountingPeriod* findPeriod(const std::string& periodId) const {
        for (const auto& period : periods) {
            if (period.id == periodId) return &period;
        }
        return nullptr;
    }

    static std::string makeId(const Date& start) {
        auto iso = start.toString();
        return "FY" + iso.substr(0, 4) + iso.substr(5, 2) + iso.substr(8, 2);
    }

    static std::string makePeriodId(const std::string& yearId, int number) {
        return yearId + "-P" + (number < 10 ? "0" : "") + std::to_string(number);
    }
};

} // namespace ledger::domain
