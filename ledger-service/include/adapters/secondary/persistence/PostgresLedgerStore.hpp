#pragma once

#include "ports/output/IJournalEntryRepository.hpp"
#include "ports/output/IBalanceRepository.hpp"
#include "settings/DbSettings.hpp"
#include "domain/LedgerException.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>
#include <map>
#include <cstdio>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища проводок и сальдо
 *
 * Таблицы:
 * - ledger_journal_entries: заголовок проводки с кодом журнала, reversal_of
 *   уникален (одна проводка сторнируется не более одного раза)
 * - ledger_journal_lines: строки, PRIMARY KEY (entry_id, line_number)
 * - ledger_account_balances: накопленное движение на нормальной стороне
 * - ledger_entry_seq: последовательность номеров JE-000001
 *
 * commitPosting выполняется одной транзакцией: строка проводки и строки
 * сальдо берутся FOR UPDATE (сальдо в порядке кодов счетов).
 */
class PostgresLedgerStore : public ports::output::IJournalEntryRepository,
                            public ports::output::IBalanceRepository {
public:
    explicit PostgresLedgerStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::string nextEntryId() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            auto result = txn.exec("SELECT nextval('ledger_entry_seq')");
            txn.commit();

            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "JE-%06lld",
                          static_cast<long long>(result[0][0].as<int64_t>()));
            return buffer;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] nextEntryId error: " << e.what() << std::endl;
            throw;
        }
    }

    domain::JournalEntry saveDraft(const domain::JournalEntry& entry) override {
        if (!domain::isPending(entry.status)) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "saveDraft called with " + domain::toString(entry.status) + " entry " + entry.entryId);
        }

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            requirePending(txn, entry.entryId);
            writeEntry(txn, entry);

            txn.commit();
            return entry;

        } catch (const domain::LedgerException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] saveDraft error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::JournalEntry> findById(const std::string& entryId) override {
        pqxx::params params;
        params.append(entryId);
        auto entries = select("WHERE e.entry_id = $1", params);
        if (entries.empty()) return std::nullopt;
        return entries.front();
    }

    std::vector<domain::JournalEntry> find(const domain::EntryFilter& filter) override {
        pqxx::params params;
        std::string where;
        auto next = [&params]() { return "$" + std::to_string(params.size()); };
        auto add = [&where](const std::string& condition) {
            where += where.empty() ? "WHERE " : " AND ";
            where += condition;
        };

        if (!filter.statuses.empty()) {
            std::string list;
            for (auto status : filter.statuses) {
                params.append(domain::toString(status));
                list += (list.empty() ? "" : ", ") + next();
            }
            add("e.status IN (" + list + ")");
        }
        if (filter.dateFrom) {
            params.append(filter.dateFrom->toString());
            add("e.entry_date >= " + next() + "::date");
        }
        if (filter.dateTo) {
            params.append(filter.dateTo->toString());
            add("e.entry_date <= " + next() + "::date");
        }
        if (filter.reversalOf) {
            params.append(*filter.reversalOf);
            add("e.reversal_of = " + next());
        }
        if (filter.journalCode) {
            params.append(*filter.journalCode);
            add("e.journal_code = " + next());
        }
        if (filter.accountCode) {
            params.append(*filter.accountCode);
            add("EXISTS (SELECT 1 FROM ledger_journal_lines x "
                "WHERE x.entry_id = e.entry_id AND x.account_code = " + next() + ")");
        }

        return select(where, params);
    }

    int archive(const domain::Date& from, const domain::Date& to) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "UPDATE ledger_journal_entries SET status = 'ARCHIVED' "
                "WHERE status = 'POSTED' AND entry_date BETWEEN $1::date AND $2::date",
                from.toString(),
                to.toString()
            );
            txn.commit();

            std::cout << "[PostgresLedgerStore] Archived " << result.affected_rows() << " entries "
                      << from.toString() << ".." << to.toString() << std::endl;
            return static_cast<int>(result.affected_rows());

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] archive error: " << e.what() << std::endl;
            throw;
        }
    }

    bool archiveEntry(const std::string& entryId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "UPDATE ledger_journal_entries SET status = 'ARCHIVED' "
                "WHERE entry_id = $1 AND status = 'POSTED'",
                entryId
            );
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] archiveEntry error: " << e.what() << std::endl;
            throw;
        }
    }

    void commitPosting(const domain::JournalEntry& posted,
                       const std::vector<domain::BalanceDelta>& deltas) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            requirePending(txn, posted.entryId);

            // deltas уже упорядочены по коду счёта: одинаковый порядок
            // блокировок во всех транзакциях
            for (const auto& delta : deltas) {
                txn.exec_params(
                    "INSERT INTO ledger_account_balances (account_code, movement, updated_at) "
                    "VALUES ($1, 0, $2) ON CONFLICT (account_code) DO NOTHING",
                    delta.accountCode,
                    posted.postedAt ? posted.postedAt->toMillis() : domain::Timestamp::now().toMillis()
                );
                auto current = txn.exec_params(
                    "SELECT movement FROM ledger_account_balances WHERE account_code = $1 FOR UPDATE",
                    delta.accountCode
                );
                auto movement = domain::Money(current[0]["movement"].as<int64_t>()) + delta.amount;

                auto after = delta.openingBalance + movement;
                if (!delta.allowNegative && after.isNegative()) {
                    throw domain::LedgerException(domain::LedgerErrorCode::NEGATIVE_BALANCE,
                        "Posting " + posted.entryId + " would take account " + delta.accountCode +
                        " to " + after.toString());
                }

                txn.exec_params(
                    "UPDATE ledger_account_balances SET movement = $2, updated_at = $3 "
                    "WHERE account_code = $1",
                    delta.accountCode,
                    movement.minor,
                    domain::Timestamp::now().toMillis()
                );
            }

            writeEntry(txn, posted);
            txn.commit();

        } catch (const domain::LedgerException&) {
            throw;
        } catch (const pqxx::serialization_failure& e) {
            throw domain::LedgerException(domain::LedgerErrorCode::CONCURRENCY_CONFLICT, e.what());
        } catch (const pqxx::deadlock_detected& e) {
            throw domain::LedgerException(domain::LedgerErrorCode::CONCURRENCY_CONFLICT, e.what());
        } catch (const pqxx::unique_violation& e) {
            // Вторая сторнирующая проводка на тот же оригинал
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Entry " + posted.entryId + " conflicts with an existing entry: " + e.what());
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] commitPosting error: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Money findMovement(const std::string& accountCode) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            auto result = txn.exec_params(
                "SELECT movement FROM ledger_account_balances WHERE account_code = $1", accountCode);
            txn.commit();

            if (result.empty()) return domain::Money();
            return domain::Money(result[0]["movement"].as<int64_t>());

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] findMovement error: " << e.what() << std::endl;
            throw;
        }
    }

    std::map<std::string, domain::Money> findAllMovements() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            auto result = txn.exec("SELECT account_code, movement FROM ledger_account_balances");
            txn.commit();

            std::map<std::string, domain::Money> movements;
            for (const auto& row : result) {
                movements[row["account_code"].as<std::string>()] = domain::Money(row["movement"].as<int64_t>());
            }
            return movements;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] findAllMovements error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static void requirePending(pqxx::work& txn, const std::string& entryId) {
        auto existing = txn.exec_params(
            "SELECT status FROM ledger_journal_entries WHERE entry_id = $1 FOR UPDATE", entryId);
        if (existing.empty()) return;

        auto status = domain::parseEntryStatus(existing[0]["status"].as<std::string>());
        if (!domain::isPending(status)) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Entry " + entryId + " is already " + domain::toString(status));
        }
    }

    static void writeEntry(pqxx::work& txn, const domain::JournalEntry& entry) {
        txn.exec_params(
            R"(
                INSERT INTO ledger_journal_entries (entry_id, entry_date, reference, description, status,
                    total_debit, total_credit, created_by, created_at, posted_at, reversal_of, is_closing,
                    journal_code, validated_by, validated_at, posted_by)
                VALUES ($1, $2::date, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16)
                ON CONFLICT (entry_id) DO UPDATE SET
                    entry_date = EXCLUDED.entry_date,
                    reference = EXCLUDED.reference,
                    description = EXCLUDED.description,
                    status = EXCLUDED.status,
                    total_debit = EXCLUDED.total_debit,
                    total_credit = EXCLUDED.total_credit,
                    posted_at = EXCLUDED.posted_at,
                    validated_by = EXCLUDED.validated_by,
                    validated_at = EXCLUDED.validated_at,
                    posted_by = EXCLUDED.posted_by
            )",
            entry.entryId,
            entry.date.toString(),
            entry.reference,
            entry.description,
            domain::toString(entry.status),
            entry.totalDebit.minor,
            entry.totalCredit.minor,
            entry.createdBy,
            entry.createdAt.toMillis(),
            entry.postedAt ? std::optional<int64_t>(entry.postedAt->toMillis()) : std::nullopt,
            entry.reversalOf,
            entry.closing,
            entry.journalCode,
            entry.validatedBy,
            entry.validatedAt ? std::optional<int64_t>(entry.validatedAt->toMillis()) : std::nullopt,
            entry.postedBy
        );

        txn.exec_params("DELETE FROM ledger_journal_lines WHERE entry_id = $1", entry.entryId);
        for (const auto& line : entry.lines) {
            txn.exec_params(
                "INSERT INTO ledger_journal_lines (entry_id, line_number, account_code, analytic_account, "
                "debit, credit, description) VALUES ($1, $2, $3, $4, $5, $6, $7)",
                entry.entryId,
                line.lineNumber,
                line.accountCode,
                line.analyticAccount,
                line.debit.minor,
                line.credit.minor,
                line.description
            );
        }
    }

    std::vector<domain::JournalEntry> select(const std::string& where, const pqxx::params& params) {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto headers = txn.exec_params(
                "SELECT e.entry_id, to_char(e.entry_date, 'YYYY-MM-DD') AS entry_date, e.reference, "
                "e.description, e.status, e.total_debit, e.total_credit, e.created_by, e.created_at, "
                "e.posted_at, e.reversal_of, e.is_closing, e.journal_code, e.validated_by, e.validated_at, e.posted_by "
                "FROM ledger_journal_entries e " + where +
                " ORDER BY e.entry_date, length(e.entry_id), e.entry_id",
                params
            );
            auto lines = txn.exec_params(
                "SELECT l.entry_id, l.line_number, l.account_code, l.analytic_account, l.debit, l.credit, "
                "l.description FROM ledger_journal_lines l "
                "WHERE l.entry_id IN (SELECT e.entry_id FROM ledger_journal_entries e " + where + ") "
                "ORDER BY l.entry_id, l.line_number",
                params
            );
            txn.commit();

            std::map<std::string, std::vector<domain::JournalEntryLine>> linesByEntry;
            for (const auto& row : lines) {
                domain::JournalEntryLine line;
                line.lineNumber = row["line_number"].as<int>();
                line.accountCode = row["account_code"].as<std::string>();
                if (!row["analytic_account"].is_null()) {
                    line.analyticAccount = row["analytic_account"].as<std::string>();
                }
                line.debit = domain::Money(row["debit"].as<int64_t>());
                line.credit = domain::Money(row["credit"].as<int64_t>());
                line.description = row["description"].as<std::string>();
                linesByEntry[row["entry_id"].as<std::string>()].push_back(line);
            }

            std::vector<domain::JournalEntry> entries;
            for (const auto& row : headers) {
                domain::JournalEntry entry;
                entry.entryId = row["entry_id"].as<std::string>();
                entry.date = domain::Date::parse(row["entry_date"].as<std::string>());
                entry.reference = row["reference"].as<std::string>();
                entry.description = row["description"].as<std::string>();
                entry.status = domain::parseEntryStatus(row["status"].as<std::string>());
                entry.totalDebit = domain::Money(row["total_debit"].as<int64_t>());
                entry.totalCredit = domain::Money(row["total_credit"].as<int64_t>());
                entry.createdBy = row["created_by"].as<std::string>();
                entry.createdAt = domain::Timestamp::fromMillis(row["created_at"].as<int64_t>());
                if (!row["posted_at"].is_null()) {
                    entry.postedAt = domain::Timestamp::fromMillis(row["posted_at"].as<int64_t>());
                }
                if (!row["reversal_of"].is_null()) {
                    entry.reversalOf = row["reversal_of"].as<std::string>();
                }
                entry.closing = row["is_closing"].as<bool>();
                entry.journalCode = row["journal_code"].as<std::string>();
                if (!row["validated_by"].is_null()) {
                    entry.validatedBy = row["validated_by"].as<std::string>();
                    entry.validatedAt = domain::Timestamp::fromMillis(row["validated_at"].as<int64_t>());
                }
                if (!row["posted_by"].is_null()) {
                    entry.postedBy = row["posted_by"].as<std::string>();
                }
                entry.lines = std::move(linesByEntry[entry.entryId]);
                entries.push_back(std::move(entry));
            }
            return entries;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] select error: " << e.what() << std::endl;
            throw;
        }
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec("CREATE SEQUENCE IF NOT EXISTS ledger_entry_seq");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_journal_entries (
                    entry_id VARCHAR(32) PRIMARY KEY,
                    entry_date DATE NOT NULL,
                    reference TEXT NOT NULL DEFAULT '',
                    description TEXT NOT NULL DEFAULT '',
                    status VARCHAR(16) NOT NULL,
                    total_debit BIGINT NOT NULL DEFAULT 0,
                    total_credit BIGINT NOT NULL DEFAULT 0,
                    created_by VARCHAR(128) NOT NULL DEFAULT '',
                    created_at BIGINT NOT NULL,
                    posted_at BIGINT,
                    reversal_of VARCHAR(32),
                    is_closing BOOLEAN NOT NULL DEFAULT FALSE,
                    journal_code VARCHAR(10) NOT NULL DEFAULT 'OD',
                    validated_by VARCHAR(128),
                    validated_at BIGINT,
                    posted_by VARCHAR(128)
                )
            )");
            // Таблицы, созданные до появления журналов
            txn.exec("ALTER TABLE ledger_journal_entries "
                     "ADD COLUMN IF NOT EXISTS journal_code VARCHAR(10) NOT NULL DEFAULT 'OD'");
            txn.exec("ALTER TABLE ledger_journal_entries ADD COLUMN IF NOT EXISTS validated_by VARCHAR(128)");
            txn.exec("ALTER TABLE ledger_journal_entries ADD COLUMN IF NOT EXISTS validated_at BIGINT");
            txn.exec("ALTER TABLE ledger_journal_entries ADD COLUMN IF NOT EXISTS posted_by VARCHAR(128)");
            txn.exec(R"(
                CREATE UNIQUE INDEX IF NOT EXISTS ledger_journal_entries_reversal_uq
                ON ledger_journal_entries(reversal_of) WHERE reversal_of IS NOT NULL
            )");
            txn.exec(R"(
                CREATE INDEX IF NOT EXISTS ledger_journal_entries_date_idx
                ON ledger_journal_entries(entry_date, status)
            )");
            txn.exec(R"(
                CREATE INDEX IF NOT EXISTS ledger_journal_entries_journal_idx
                ON ledger_journal_entries(journal_code, entry_date)
            )");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_journal_lines (
                    entry_id VARCHAR(32) NOT NULL REFERENCES ledger_journal_entries(entry_id) ON DELETE CASCADE,
                    line_number INT NOT NULL,
                    account_code VARCHAR(20) NOT NULL,
                    analytic_account VARCHAR(20),
                    debit BIGINT NOT NULL DEFAULT 0 CHECK (debit >= 0),
                    credit BIGINT NOT NULL DEFAULT 0 CHECK (credit >= 0),
                    description TEXT NOT NULL DEFAULT '',
                    PRIMARY KEY (entry_id, line_number)
                )
            )");
            txn.exec(R"(
                CREATE INDEX IF NOT EXISTS ledger_journal_lines_account_idx
                ON ledger_journal_lines(account_code)
            )");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_account_balances (
                    account_code VARCHAR(20) PRIMARY KEY,
                    movement BIGINT NOT NULL DEFAULT 0,
                    updated_at BIGINT NOT NULL
                )
            )");

            txn.commit();
            std::cout << "[PostgresLedgerStore] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace ledger::adapters::secondary
