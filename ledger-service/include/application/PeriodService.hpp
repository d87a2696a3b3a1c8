#pragma once

#include "ports/input/IPeriodService.hpp"
#include "ports/output/IPeriodRepository.hpp"
#include "ports/output/IJournalEntryRepository.hpp"
#include "application/PeriodGate.hpp"
#include "domain/LedgerException.hpp"
#include <memory>
#include <iostream>
#include <algorithm>
#include <mutex>

namespace ledger::application {

/**
 * @brief Реестр финансовых годов и учётных периодов
 *
 * Закрытие периодов строго по порядку внутри года; закрытие необратимо.
 * Блокировка (lock) независима от закрытия и снимается unlockPeriod.
 */
class PeriodService : public ports::input::IPeriodService {
public:
    PeriodService(
        std::shared_ptr<ports::output::IPeriodRepository> periodRepo,
        std::shared_ptr<ports::output::IJournalEntryRepository> entryRepo,
        std::shared_ptr<PeriodGate> gate
    ) : periodRepo_(std::move(periodRepo))
      , entryRepo_(std::move(entryRepo))
      , gate_(std::move(gate))
    {
        std::cout << "[PeriodService] Created" << std::endl;
    }

    domain::FiscalYear createFiscalYear(const ports::input::CreateFiscalYearRequest& request) override {
        if (!(request.startDate < request.endDate)) {
            throw domain::LedgerException(domain::LedgerErrorCode::PARTITION_ERROR,
                "Fiscal year must end after it starts: " + request.startDate.toString() +
                " .. " + request.endDate.toString());
        }

        auto ranges = request.periods.empty()
            ? monthlyPartition(request.startDate, request.endDate)
            : request.periods;
        validatePartition(request.startDate, request.endDate, ranges);

        std::lock_guard<std::mutex> lock(createMutex_);

        domain::DateRange yearRange{request.startDate, request.endDate};
        for (const auto& existing : periodRepo_->findAllFiscalYears()) {
            if (existing.range().overlaps(yearRange)) {
                throw domain::LedgerException(domain::LedgerErrorCode::PARTITION_ERROR,
                    "Fiscal year overlaps existing year " + existing.id);
            }
        }

        domain::FiscalYear year;
        year.id = domain::FiscalYear::makeId(request.startDate);
        year.name = request.name.empty() ? year.id : request.name;
        year.startDate = request.startDate;
        year.endDate = request.endDate;

        int number = 0;
        for (const auto& range : ranges) {
            domain::AccountingPeriod period;
            period.periodNumber = ++number;
            period.id = domain::FiscalYear::makePeriodId(year.id, period.periodNumber);
            period.fiscalYearId = year.id;
            period.startDate = range.start;
            period.endDate = range.end;
            year.periods.push_back(period);
        }

        std::cout << "[PeriodService] Creating fiscal year " << year.id
                  << " [" << year.startDate.toString() << ", " << year.endDate.toString() << ")"
                  << " periods=" << year.periods.size() << std::endl;

        return periodRepo_->saveFiscalYear(year);
    }

    domain::FiscalYear getFiscalYear(const std::string& yearId) override {
        auto year = periodRepo_->findFiscalYear(yearId);
        if (!year) {
            throw domain::LedgerException(domain::LedgerErrorCode::NOT_FOUND,
                "Fiscal year not found: " + yearId);
        }
        return *year;
    }

    std::vector<domain::FiscalYear> listFiscalYears() override {
        auto years = periodRepo_->findAllFiscalYears();
        std::sort(years.begin(), years.end(),
                  [](const domain::FiscalYear& a, const domain::FiscalYear& b) {
                      return a.startDate < b.startDate;
                  });
        return years;
    }

    domain::AccountingPeriod getPeriod(const std::string& periodId) override {
        auto period = periodRepo_->findPeriod(periodId);
        if (!period) {
            throw domain::LedgerException(domain::LedgerErrorCode::NOT_FOUND,
                "Period not found: " + periodId);
        }
        return *period;
    }

    std::optional<domain::AccountingPeriod> findPeriodForDate(const domain::Date& date) override {
        return periodRepo_->findPeriodByDate(date);
    }

    bool isOpenForPosting(const domain::Date& date) override {
        auto period = periodRepo_->findPeriodByDate(date);
        if (!period || !period->acceptsPostings()) {
            return false;
        }
        auto year = periodRepo_->findFiscalYear(period->fiscalYearId);
        return year && !year->isClosed;
    }

    domain::AccountingPeriod closePeriod(const std::string& periodId) override {
        getPeriod(periodId);

        // Ждём завершения идущих проведений в этот период
        auto access = gate_->exclusive(periodId);
        auto period = getPeriod(periodId);

        if (period.isClosed) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Period already closed: " + periodId);
        }

        auto year = getFiscalYear(period.fiscalYearId);
        for (const auto& earlier : year.periods) {
            if (earlier.periodNumber < period.periodNumber && !earlier.isClosed) {
                throw domain::LedgerException(domain::LedgerErrorCode::OUT_OF_ORDER,
                    "Cannot close " + periodId + ": earlier period " + earlier.id + " is still open");
            }
        }

        domain::EntryFilter pending;
        pending.statuses = {domain::EntryStatus::DRAFT, domain::EntryStatus::BALANCED};
        pending.dateFrom = period.startDate;
        pending.dateTo = period.range().lastDay();
        auto drafts = entryRepo_->find(pending);
        if (!drafts.empty()) {
            throw domain::LedgerException(domain::LedgerErrorCode::HAS_DRAFT_ENTRIES,
                "Cannot close " + periodId + ": " + std::to_string(drafts.size()) +
                " unposted entries (first: " + drafts.front().entryId + ")");
        }

        period.isClosed = true;
        periodRepo_->savePeriod(period);

        std::cout << "[PeriodService] Closed period " << periodId << std::endl;
        return period;
    }

    domain::AccountingPeriod lockPeriod(const std::string& periodId) override {
        getPeriod(periodId);
        auto access = gate_->exclusive(periodId);
        auto period = getPeriod(periodId);

        if (!period.isLocked) {
            period.isLocked = true;
            periodRepo_->savePeriod(period);
            std::cout << "[PeriodService] Locked period " << periodId << std::endl;
        }
        return period;
    }

    domain::AccountingPeriod unlockPeriod(const std::string& periodId) override {
        getPeriod(periodId);
        auto access = gate_->exclusive(periodId);
        auto period = getPeriod(periodId);

        if (period.isLocked) {
            period.isLocked = false;
            periodRepo_->savePeriod(period);
            std::cout << "[PeriodService] Unlocked period " << periodId << std::endl;
        }
        return period;
    }

private:
    std::shared_ptr<ports::output::IPeriodRepository> periodRepo_;
    std::shared_ptr<ports::output::IJournalEntryRepository> entryRepo_;
    std::shared_ptr<PeriodGate> gate_;
    std::mutex createMutex_;

    static std::vector<domain::DateRange> monthlyPartition(const domain::Date& start, const domain::Date& end) {
        std::vector<domain::DateRange> ranges;
        auto cursor = start;
        while (cursor < end) {
            auto next = std::min(cursor.firstOfNextMonths(1), end);
            ranges.push_back({cursor, next});
            cursor = next;
        }
        return ranges;
    }

    static void validatePartition(const domain::Date& start, const domain::Date& end,
                                  std::vector<domain::DateRange>& ranges) {
        std::sort(ranges.begin(), ranges.end(),
                  [](const domain::DateRange& a, const domain::DateRange& b) { return a.start < b.start; });

        auto fail = [](const std::string& message) {
            throw domain::LedgerException(domain::LedgerErrorCode::PARTITION_ERROR, message);
        };

        if (ranges.front().start != start) {
            fail("First period must start on " + start.toString() + ", got " + ranges.front().start.toString());
        }
        for (size_t i = 0; i < ranges.size(); ++i) {
            if (!(ranges[i].start < ranges[i].end)) {
                fail("Empty period starting " + ranges[i].start.toString());
            }
            if (i + 1 < ranges.size() && ranges[i].end != ranges[i + 1].start) {
                fail(ranges[i].end < ranges[i + 1].start
                         ? "Gap between " + ranges[i].end.toString() + " and " + ranges[i + 1].start.toString()
                         : "Periods overlap at " + ranges[i + 1].start.toString());
            }
        }
        if (ranges.back().end != end) {
            fail("Last period must end on " + end.toString() + ", got " + ranges.back().end.toString());
        }
    }
};

} // namespace ledger::application
