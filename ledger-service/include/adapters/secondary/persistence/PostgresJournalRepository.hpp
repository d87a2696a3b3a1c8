#pragma once

#include "ports/output/IJournalRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация справочника журналов
 *
 * Таблица: ledger_journals
 * - code VARCHAR(10) PRIMARY KEY
 * - default_debit_account / default_credit_account NULL (код счёта, проверяется сервисом)
 * - created_at / updated_at BIGINT (epoch ms)
 */
class PostgresJournalRepository : public ports::output::IJournalRepository {
public:
    explicit PostgresJournalRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    domain::Journal save(const domain::Journal& journal) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                R"(
                    INSERT INTO ledger_journals (code, name, description, type, is_default, is_active,
                        default_debit_account, default_credit_account, created_at, updated_at)
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10)
                    ON CONFLICT (code) DO UPDATE SET
                        name = EXCLUDED.name,
                        description = EXCLUDED.description,
                        is_default = EXCLUDED.is_default,
                        is_active = EXCLUDED.is_active,
                        default_debit_account = EXCLUDED.default_debit_account,
                        default_credit_account = EXCLUDED.default_credit_account,
                        updated_at = EXCLUDED.updated_at
                )",
                journal.code,
                journal.name,
                journal.description,
                domain::toString(journal.type),
                journal.isDefault,
                journal.isActive,
                journal.defaultDebitAccount,
                journal.defaultCreditAccount,
                journal.createdAt.toMillis(),
                journal.updatedAt.toMillis()
            );

            txn.commit();
            return journal;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresJournalRepository] save error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Journal> findByCode(const std::string& code) override {
        auto journals = select("WHERE code = $1", code);
        if (journals.empty()) return std::nullopt;
        return journals.front();
    }

    std::vector<domain::Journal> findAll() override {
        return select("");
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    template <typename... Args>
    std::vector<domain::Journal> select(const std::string& where, Args&&... args) {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT code, name, description, type, is_default, is_active, "
                "default_debit_account, default_credit_account, created_at, updated_at "
                "FROM ledger_journals " + where + " ORDER BY code",
                std::forward<Args>(args)...
            );
            txn.commit();

            std::vector<domain::Journal> journals;
            for (const auto& row : result) {
                journals.push_back(rowToJournal(row));
            }
            return journals;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresJournalRepository] select error: " << e.what() << std::endl;
            throw;
        }
    }

    static std::optional<std::string> nullableString(const pqxx::field& field) {
        if (field.is_null()) return std::nullopt;
        return field.as<std::string>();
    }

    static domain::Journal rowToJournal(const pqxx::row& row) {
        domain::Journal journal(
            row["code"].as<std::string>(),
            row["name"].as<std::string>(),
            domain::parseJournalType(row["type"].as<std::string>())
        );
        journal.description = row["description"].as<std::string>();
        journal.isDefault = row["is_default"].as<bool>();
        journal.isActive = row["is_active"].as<bool>();
        journal.defaultDebitAccount = nullableString(row["default_debit_account"]);
        journal.defaultCreditAccount = nullableString(row["default_credit_account"]);
        journal.createdAt = domain::Timestamp::fromMillis(row["created_at"].as<int64_t>());
        journal.updatedAt = domain::Timestamp::fromMillis(row["updated_at"].as<int64_t>());
        return journal;
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_journals (
                    code VARCHAR(10) PRIMARY KEY,
                    name VARCHAR(100) NOT NULL,
                    description TEXT NOT NULL DEFAULT '',
                    type VARCHAR(16) NOT NULL,
                    is_default BOOLEAN NOT NULL DEFAULT FALSE,
                    is_active BOOLEAN NOT NULL DEFAULT TRUE,
                    default_debit_account VARCHAR(20),
                    default_credit_account VARCHAR(20),
                    created_at BIGINT NOT NULL,
                    updated_at BIGINT NOT NULL
                )
            )");
            // Не более одного журнала по умолчанию
            txn.exec("CREATE UNIQUE INDEX IF NOT EXISTS ledger_journals_default_idx "
                     "ON ledger_journals(is_default) WHERE is_default");

            txn.commit();
            std::cout << "[PostgresJournalRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresJournalRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace ledger::adapters::secondary
