#pragma once

#include "ports/output/IPeriodRepository.hpp"
#include <map>
#include <mutex>
#include <stdexcept>

namespace ledger::adapters::secondary {

/**
 * @brief Финансовые годы в памяти; периоды хранятся внутри своего года
 */
class InMemoryPeriodRepository : public ports::output::IPeriodRepository {
public:
    domain::FiscalYear saveFiscalYear(const domain::FiscalYear& year) override {
        std::lock_guard<std::mutex> lock(mutex_);
        years_[year.id] = year;
        return year;
    }

    void savePeriod(const domain::AccountingPeriod& period) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = years_.find(period.fiscalYearId);
        if (it == years_.end()) {
            throw std::runtime_error("Fiscal year not found for period " + period.id);
        }
        for (auto& stored : it->second.periods) {
            if (stored.id == period.id) {
                stored = period;
                return;
            }
        }
        throw std::runtime_error("Period not found: " + period.id);
    }

    std::optional<domain::FiscalYear> findFiscalYear(const std::string& yearId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = years_.find(yearId);
        if (it == years_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::FiscalYear> findAllFiscalYears() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::FiscalYear> result;
        for (const auto& [id, year] : years_) {
            result.push_back(year);
        }
        return result;
    }

    std::optional<domain::AccountingPeriod> findPeriod(const std::string& periodId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, year] : years_) {
            if (auto period = year.findPeriod(periodId)) {
                return *period;
            }
        }
        return std::nullopt;
    }

    std::optional<domain::AccountingPeriod> findPeriodByDate(const domain::Date& date) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, year] : years_) {
            if (!year.contains(date)) continue;
            for (const auto& period : year.periods) {
                if (period.contains(date)) return period;
            }
        }
        return std::nullopt;
    }

    // Test helpers
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        years_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return years_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, domain::FiscalYear> years_;
};

} // namespace ledger::adapters::secondary
