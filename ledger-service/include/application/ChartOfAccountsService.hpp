#pragma once

#include "ports/input/IChartOfAccountsService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/LedgerException.hpp"
#include <memory>
#include <iostream>
#include <algorithm>
#include <set>
#include <mutex>

namespace ledger::application {

/**
 * @brief План счетов
 *
 * Дерево хранится плоско (код → счёт, parentCode: внешний ключ),
 * предки и потомки вычисляются явным обходом.
 */
class ChartOfAccountsService : public ports::input::IChartOfAccountsService {
public:
    static constexpr size_t MAX_CODE_LENGTH = 20;
    static constexpr size_t MAX_NAME_LENGTH = 200;

    ChartOfAccountsService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : accountRepo_(std::move(accountRepo))
      , settings_(std::move(settings))
    {
        std::cout << "[ChartOfAccountsService] Created" << std::endl;
    }

    domain::Account createAccount(const ports::input::CreateAccountRequest& request) override {
        validateIdentity(request.code, request.name);

        if (!request.allowNegative && request.openingBalance.isNegative()) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_ARGUMENT,
                "Negative opening balance on account " + request.code + " that disallows negatives");
        }
        // Сводный и аналитический счета не принимают строк: их входящее
        // сальдо нечем было бы обнулить при закрытии года
        if ((!request.allowPosting || request.isAnalytic) && !request.openingBalance.isZero()) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_ARGUMENT,
                "Opening balance on non-postable account " + request.code + " must be zero");
        }

        // Проверка уникальности и вставка под одним замком:
        // два параллельных createAccount с одним кодом не должны оба пройти
        std::lock_guard<std::mutex> lock(writeMutex_);

        if (accountRepo_->findByCode(request.code)) {
            throw domain::LedgerException(domain::LedgerErrorCode::DUPLICATE_CODE,
                "Account code already exists: " + request.code);
        }

        if (request.parentCode) {
            validateParent(request.code, *request.parentCode);
        }

        domain::Account account(request.code, request.name, request.type, request.parentCode);
        account.description = request.description;
        account.allowNegative = request.allowNegative;
        account.allowPosting = request.allowPosting;
        account.isAnalytic = request.isAnalytic;
        account.openingBalance = request.openingBalance;

        std::cout << "[ChartOfAccountsService] Creating account " << account.code
                  << " type=" << domain::toString(account.type)
                  << (account.parentCode ? " parent=" + *account.parentCode : "") << std::endl;

        return accountRepo_->save(account);
    }

    domain::Account getAccount(const std::string& code) override {
        auto account = accountRepo_->findByCode(code);
        if (!account) {
            throw domain::LedgerException(domain::LedgerErrorCode::NOT_FOUND,
                "Account not found: " + code);
        }
        return *account;
    }

    std::vector<domain::Account> listAccounts(const ports::input::AccountFilter& filter) override {
        std::vector<domain::Account> result;
        for (auto& account : accountRepo_->findAll()) {
            if (filter.type && account.type != *filter.type) continue;
            if (filter.parentCode && account.parentCode != filter.parentCode) continue;
            if (filter.active && account.isActive != *filter.active) continue;
            result.push_back(std::move(account));
        }
        sortByCode(result);
        return result;
    }

    std::vector<domain::Account> listChildren(const std::string& code) override {
        getAccount(code);
        auto children = accountRepo_->findByParent(code);
        sortByCode(children);
        return children;
    }

    std::vector<domain::Account> ancestorsOf(const std::string& code) override {
        auto current = getAccount(code);

        std::vector<domain::Account> chain;
        std::set<std::string> visited{current.code};
        while (current.parentCode) {
            if (!visited.insert(*current.parentCode).second) {
                // Цикл возможен только при порче данных в хранилище
                throw domain::LedgerException(domain::LedgerErrorCode::INVALID_PARENT,
                    "Cycle detected in account tree at " + *current.parentCode);
            }
            current = getAccount(*current.parentCode);
            chain.push_back(current);
        }

        std::reverse(chain.begin(), chain.end());
        return chain;
    }

    std::vector<domain::Account> descendantsOf(const std::string& code) override {
        getAccount(code);

        std::vector<domain::Account> result;
        std::set<std::string> visited{code};
        std::vector<std::string> stack{code};
        while (!stack.empty()) {
            auto current = stack.back();
            stack.pop_back();
            auto children = accountRepo_->findByParent(current);
            sortByCode(children);
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                if (visited.insert(it->code).second) {
                    stack.push_back(it->code);
                }
            }
            for (auto& child : children) {
                result.push_back(std::move(child));
            }
        }
        return result;
    }

    domain::Account updateAccount(const std::string& code,
                                  const ports::input::UpdateAccountRequest& request) override {
        std::lock_guard<std::mutex> lock(writeMutex_);
        auto account = getAccount(code);

        if (request.name) {
            validateIdentity(account.code, *request.name);
            account.name = *request.name;
        }
        if (request.description) {
            account.description = *request.description;
        }
        if (request.allowNegative) {
            account.allowNegative = *request.allowNegative;
        }
        account.updatedAt = domain::Timestamp::now();

        std::cout << "[ChartOfAccountsService] Updated account " << code << std::endl;
        return accountRepo_->save(account);
    }

    domain::Account deactivate(const std::string& code) override {
        std::lock_guard<std::mutex> lock(writeMutex_);
        auto account = getAccount(code);

        for (const auto& child : accountRepo_->findByParent(code)) {
            if (child.isActive) {
                throw domain::LedgerException(domain::LedgerErrorCode::HAS_ACTIVE_CHILDREN,
                    "Account " + code + " has active child " + child.code);
            }
        }

        account.isActive = false;
        account.updatedAt = domain::Timestamp::now();
        std::cout << "[ChartOfAccountsService] Deactivated account " << code << std::endl;
        return accountRepo_->save(account);
    }

    domain::Account reactivate(const std::string& code) override {
        std::lock_guard<std::mutex> lock(writeMutex_);
        auto account = getAccount(code);

        if (account.parentCode) {
            auto parent = accountRepo_->findByCode(*account.parentCode);
            if (!parent || !parent->isActive) {
                throw domain::LedgerException(domain::LedgerErrorCode::INVALID_PARENT,
                    "Cannot reactivate " + code + ": parent " + *account.parentCode + " is inactive");
            }
        }

        account.isActive = true;
        account.updatedAt = domain::Timestamp::now();
        std::cout << "[ChartOfAccountsService] Reactivated account " << code << std::endl;
        return accountRepo_->save(account);
    }

    int seedDefaultChart() override {
        struct Seed {
            const char* code;
            const char* name;
            domain::AccountType type;
        };

        const Seed seeds[] = {
            {"401", "Fournisseurs", domain::AccountType::LIABILITY},
            {"411", "Clients", domain::AccountType::ASSET},
            {"501", "Caisse", domain::AccountType::ASSET},
            {"521", "Banque", domain::AccountType::ASSET},
            {"601", "Achats", domain::AccountType::EXPENSE},
            {"626", "Frais de transport", domain::AccountType::EXPENSE},
            {"641", "Salaires", domain::AccountType::EXPENSE},
            {"681", "Dotations aux amortissements", domain::AccountType::EXPENSE},
            {"701", "Ventes", domain::AccountType::REVENUE},
        };

        int created = 0;
        auto seedOne = [&](const std::string& code, const std::string& name, domain::AccountType type) {
            if (accountRepo_->findByCode(code)) return;
            ports::input::CreateAccountRequest request;
            request.code = code;
            request.name = name;
            request.type = type;
            createAccount(request);
            ++created;
        };

        for (const auto& seed : seeds) {
            seedOne(seed.code, seed.name, seed.type);
        }
        seedOne(settings_->retainedEarningsAccount, "Report a nouveau", domain::AccountType::EQUITY);

        std::cout << "[ChartOfAccountsService] Seeded " << created << " accounts" << std::endl;
        return created;
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::mutex writeMutex_;

    void validateIdentity(const std::string& code, const std::string& name) const {
        if (code.empty() || code.size() > MAX_CODE_LENGTH) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_ARGUMENT,
                "Account code must be 1.." + std::to_string(MAX_CODE_LENGTH) + " characters");
        }
        if (name.empty() || name.size() > MAX_NAME_LENGTH) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_ARGUMENT,
                "Account name must be 1.." + std::to_string(MAX_NAME_LENGTH) + " characters");
        }
    }

    void validateParent(const std::string& code, const std::string& parentCode) {
        if (parentCode == code) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_PARENT,
                "Account cannot be its own parent: " + code);
        }

        auto parent = accountRepo_->findByCode(parentCode);
        if (!parent) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_PARENT,
                "Parent account not found: " + parentCode);
        }
        if (!parent->isActive) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_PARENT,
                "Parent account is inactive: " + parentCode);
        }

        // Связь образует цикл, если code уже встречается среди предков родителя
        std::set<std::string> visited{parentCode};
        auto current = parent;
        while (current && current->parentCode) {
            if (*current->parentCode == code || !visited.insert(*current->parentCode).second) {
                throw domain::LedgerException(domain::LedgerErrorCode::INVALID_PARENT,
                    "Linking " + code + " under " + parentCode + " would form a cycle");
            }
            current = accountRepo_->findByCode(*current->parentCode);
        }
    }

    static void sortByCode(std::vector<domain::Account>& accounts) {
        std::sort(accounts.begin(), accounts.end(),
                  [](const domain::Account& a, const domain::Account& b) { return a.code < b.code; });
    }
};

} // namespace ledger::application
