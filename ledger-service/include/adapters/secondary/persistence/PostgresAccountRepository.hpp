#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация плана счетов
 *
 * Таблица: ledger_accounts
 * - code VARCHAR(20) PRIMARY KEY
 * - parent_code VARCHAR(20) NULL REFERENCES ledger_accounts(code)
 * - opening_balance BIGINT (минорные единицы, нормальная сторона)
 * - created_at / updated_at BIGINT (epoch ms)
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    domain::Account save(const domain::Account& account) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                R"(
                    INSERT INTO ledger_accounts (code, name, description, type, parent_code, is_active,
                        allow_negative, allow_posting, is_analytic, opening_balance, created_at, updated_at)
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12)
                    ON CONFLICT (code) DO UPDATE SET
                        name = EXCLUDED.name,
                        description = EXCLUDED.description,
                        is_active = EXCLUDED.is_active,
                        allow_negative = EXCLUDED.allow_negative,
                        updated_at = EXCLUDED.updated_at
                )",
                account.code,
                account.name,
                account.description,
                domain::toString(account.type),
                account.parentCode,
                account.isActive,
                account.allowNegative,
                account.allowPosting,
                account.isAnalytic,
                account.openingBalance.minor,
                account.createdAt.toMillis(),
                account.updatedAt.toMillis()
            );

            txn.commit();
            return account;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] save error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Account> findByCode(const std::string& code) override {
        auto accounts = select("WHERE code = $1", code);
        if (accounts.empty()) return std::nullopt;
        return accounts.front();
    }

    std::vector<domain::Account> findAll() override {
        return select("");
    }

    std::vector<domain::Account> findByParent(const std::string& parentCode) override {
        return select("WHERE parent_code = $1", parentCode);
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    template <typename... Args>
    std::vector<domain::Account> select(const std::string& where, Args&&... args) {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT code, name, description, type, parent_code, is_active, allow_negative, "
                "allow_posting, is_analytic, opening_balance, created_at, updated_at "
                "FROM ledger_accounts " + where + " ORDER BY code",
                std::forward<Args>(args)...
            );
            txn.commit();

            std::vector<domain::Account> accounts;
            for (const auto& row : result) {
                accounts.push_back(rowToAccount(row));
            }
            return accounts;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] select error: " << e.what() << std::endl;
            throw;
        }
    }

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account account(
            row["code"].as<std::string>(),
            row["name"].as<std::string>(),
            domain::parseAccountType(row["type"].as<std::string>()),
            row["parent_code"].is_null() ? std::nullopt
                                         : std::optional<std::string>(row["parent_code"].as<std::string>())
        );
        account.description = row["description"].as<std::string>();
        account.isActive = row["is_active"].as<bool>();
        account.allowNegative = row["allow_negative"].as<bool>();
        account.allowPosting = row["allow_posting"].as<bool>();
        account.isAnalytic = row["is_analytic"].as<bool>();
        account.openingBalance = domain::Money(row["opening_balance"].as<int64_t>());
        account.createdAt = domain::Timestamp::fromMillis(row["created_at"].as<int64_t>());
        account.updatedAt = domain::Timestamp::fromMillis(row["updated_at"].as<int64_t>());
        return account;
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_accounts (
                    code VARCHAR(20) PRIMARY KEY,
                    name VARCHAR(200) NOT NULL,
                    description TEXT NOT NULL DEFAULT '',
                    type VARCHAR(16) NOT NULL,
                    parent_code VARCHAR(20) REFERENCES ledger_accounts(code),
                    is_active BOOLEAN NOT NULL DEFAULT TRUE,
                    allow_negative BOOLEAN NOT NULL DEFAULT TRUE,
                    allow_posting BOOLEAN NOT NULL DEFAULT TRUE,
                    is_analytic BOOLEAN NOT NULL DEFAULT FALSE,
                    opening_balance BIGINT NOT NULL DEFAULT 0,
                    created_at BIGINT NOT NULL,
                    updated_at BIGINT NOT NULL
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS ledger_accounts_parent_idx ON ledger_accounts(parent_code)");

            txn.commit();
            std::cout << "[PostgresAccountRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace ledger::adapters::secondary
