#pragma once

#include "ports/output/IPeriodRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация реестра периодов
 *
 * Таблицы:
 * - ledger_fiscal_years (id, name, start_date, end_date, is_closed, closed_at)
 * - ledger_periods (id, fiscal_year_id → ledger_fiscal_years, period_number,
 *   start_date, end_date, is_closed, is_locked)
 *
 * end_date в обеих таблицах не включительно.
 */
class PostgresPeriodRepository : public ports::output::IPeriodRepository {
public:
    explicit PostgresPeriodRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    domain::FiscalYear saveFiscalYear(const domain::FiscalYear& year) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                R"(
                    INSERT INTO ledger_fiscal_years (id, name, start_date, end_date, is_closed, closed_at)
                    VALUES ($1, $2, $3::date, $4::date, $5, $6)
                    ON CONFLICT (id) DO UPDATE SET
                        name = EXCLUDED.name,
                        is_closed = EXCLUDED.is_closed,
                        closed_at = EXCLUDED.closed_at
                )",
                year.id,
                year.name,
                year.startDate.toString(),
                year.endDate.toString(),
                year.isClosed,
                year.closedAt ? std::optional<int64_t>(year.closedAt->toMillis()) : std::nullopt
            );

            for (const auto& period : year.periods) {
                upsertPeriod(txn, period);
            }

            txn.commit();
            std::cout << "[PostgresPeriodRepository] Saved fiscal year " << year.id << std::endl;
            return year;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPeriodRepository] saveFiscalYear error: " << e.what() << std::endl;
            throw;
        }
    }

    void savePeriod(const domain::AccountingPeriod& period) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            upsertPeriod(txn, period);
            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPeriodRepository] savePeriod error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::FiscalYear> findFiscalYear(const std::string& yearId) override {
        auto years = selectYears("WHERE id = $1", yearId);
        if (years.empty()) return std::nullopt;
        return years.front();
    }

    std::vector<domain::FiscalYear> findAllFiscalYears() override {
        return selectYears("");
    }

    std::optional<domain::AccountingPeriod> findPeriod(const std::string& periodId) override {
        auto periods = selectPeriods("WHERE id = $1", periodId);
        if (periods.empty()) return std::nullopt;
        return periods.front();
    }

    std::optional<domain::AccountingPeriod> findPeriodByDate(const domain::Date& date) override {
        auto periods = selectPeriods("WHERE start_date <= $1::date AND $1::date < end_date", date.toString());
        if (periods.empty()) return std::nullopt;
        return periods.front();
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static void upsertPeriod(pqxx::work& txn, const domain::AccountingPeriod& period) {
        txn.exec_params(
            R"(
                INSERT INTO ledger_periods (id, fiscal_year_id, period_number, start_date, end_date, is_closed, is_locked)
                VALUES ($1, $2, $3, $4::date, $5::date, $6, $7)
                ON CONFLICT (id) DO UPDATE SET
                    is_closed = EXCLUDED.is_closed,
                    is_locked = EXCLUDED.is_locked
            )",
            period.id,
            period.fiscalYearId,
            period.periodNumber,
            period.startDate.toString(),
            period.endDate.toString(),
            period.isClosed,
            period.isLocked
        );
    }

    template <typename... Args>
    std::vector<domain::FiscalYear> selectYears(const std::string& where, Args&&... args) {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto yearRows = txn.exec_params(
                "SELECT id, name, to_char(start_date, 'YYYY-MM-DD') AS start_date, "
                "to_char(end_date, 'YYYY-MM-DD') AS end_date, is_closed, closed_at "
                "FROM ledger_fiscal_years " + where + " ORDER BY start_date",
                std::forward<Args>(args)...
            );

            std::vector<domain::FiscalYear> years;
            for (const auto& row : yearRows) {
                domain::FiscalYear year;
                year.id = row["id"].as<std::string>();
                year.name = row["name"].as<std::string>();
                year.startDate = domain::Date::parse(row["start_date"].as<std::string>());
                year.endDate = domain::Date::parse(row["end_date"].as<std::string>());
                year.isClosed = row["is_closed"].as<bool>();
                if (!row["closed_at"].is_null()) {
                    year.closedAt = domain::Timestamp::fromMillis(row["closed_at"].as<int64_t>());
                }

                auto periodRows = txn.exec_params(
                    periodSelect() + "WHERE fiscal_year_id = $1 ORDER BY period_number", year.id);
                for (const auto& periodRow : periodRows) {
                    year.periods.push_back(rowToPeriod(periodRow));
                }
                years.push_back(year);
            }

            txn.commit();
            return years;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPeriodRepository] selectYears error: " << e.what() << std::endl;
            throw;
        }
    }

    template <typename... Args>
    std::vector<domain::AccountingPeriod> selectPeriods(const std::string& where, Args&&... args) {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(periodSelect() + where + " ORDER BY start_date",
                                          std::forward<Args>(args)...);
            txn.commit();

            std::vector<domain::AccountingPeriod> periods;
            for (const auto& row : result) {
                periods.push_back(rowToPeriod(row));
            }
            return periods;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPeriodRepository] selectPeriods error: " << e.what() << std::endl;
            throw;
        }
    }

    static std::string periodSelect() {
        return "SELECT id, fiscal_year_id, period_number, "
               "to_char(start_date, 'YYYY-MM-DD') AS start_date, "
               "to_char(end_date, 'YYYY-MM-DD') AS end_date, is_closed, is_locked "
               "FROM ledger_periods ";
    }

    static domain::AccountingPeriod rowToPeriod(const pqxx::row& row) {
        domain::AccountingPeriod period;
        period.id = row["id"].as<std::string>();
        period.fiscalYearId = row["fiscal_year_id"].as<std::string>();
        period.periodNumber = row["period_number"].as<int>();
        period.startDate = domain::Date::parse(row["start_date"].as<std::string>());
        period.endDate = domain::Date::parse(row["end_date"].as<std::string>());
        period.isClosed = row["is_closed"].as<bool>();
        period.isLocked = row["is_locked"].as<bool>();
        return period;
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_fiscal_years (
                    id VARCHAR(16) PRIMARY KEY,
                    name VARCHAR(200) NOT NULL,
                    start_date DATE NOT NULL,
                    end_date DATE NOT NULL,
                    is_closed BOOLEAN NOT NULL DEFAULT FALSE,
                    closed_at BIGINT
                )
            )");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_periods (
                    id VARCHAR(24) PRIMARY KEY,
                    fiscal_year_id VARCHAR(16) NOT NULL REFERENCES ledger_fiscal_years(id),
                    period_number INT NOT NULL,
                    start_date DATE NOT NULL,
                    end_date DATE NOT NULL,
                    is_closed BOOLEAN NOT NULL DEFAULT FALSE,
                    is_locked BOOLEAN NOT NULL DEFAULT FALSE,
                    UNIQUE (fiscal_year_id, period_number)
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS ledger_periods_dates_idx ON ledger_periods(start_date, end_date)");

            txn.commit();
            std::cout << "[PostgresPeriodRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPeriodRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace ledger::adapters::secondary
