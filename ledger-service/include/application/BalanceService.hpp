#pragma once

#include "ports/input/IBalanceService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IJournalEntryRepository.hpp"
#include "ports/output/IBalanceRepository.hpp"
#include "ports/output/IPeriodRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/LedgerException.hpp"
#include <memory>
#include <iostream>
#include <map>
#include <set>
#include <algorithm>

namespace ledger::application {

/**
 * @brief Агрегатор сальдо
 *
 * В хранилище лежит только собственное движение счёта на его нормальной
 * стороне. Входящее сальдо и свёртка по потомкам добавляются при чтении;
 * потомок с другой нормальной стороной входит в сумму родителя с минусом.
 */
class BalanceService : public ports::input::IBalanceService {
public:
    BalanceService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IJournalEntryRepository> entryRepo,
        std::shared_ptr<ports::output::IBalanceRepository> balanceRepo,
        std::shared_ptr<ports::output::IPeriodRepository> periodRepo,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : accountRepo_(std::move(accountRepo))
      , entryRepo_(std::move(entryRepo))
      , balanceRepo_(std::move(balanceRepo))
      , periodRepo_(std::move(periodRepo))
      , settings_(std::move(settings))
    {
        std::cout << "[BalanceService] Created" << std::endl;
    }

    domain::JournalEntry applyPostedEntry(const domain::JournalEntry& entry) override {
        auto posted = entry;
        posted.recomputeTotals();
        if (!posted.isBalanced()) {
            throw domain::LedgerException(domain::LedgerErrorCode::UNBALANCED,
                "Refusing to apply unbalanced entry " + entry.entryId);
        }

        // Одна дельта на счёт, в порядке кодов
        std::map<std::string, domain::BalanceDelta> byAccount;
        std::map<std::string, domain::Account> accounts;
        for (const auto& line : posted.lines) {
            auto it = accounts.find(line.accountCode);
            if (it == accounts.end()) {
                auto account = accountRepo_->findByCode(line.accountCode);
                if (!account) {
                    throw domain::LedgerException(domain::LedgerErrorCode::UNKNOWN_ACCOUNT,
                        "Unknown account: " + line.accountCode);
                }
                domain::BalanceDelta delta;
                delta.accountCode = account->code;
                delta.openingBalance = account->openingBalance;
                delta.allowNegative = account->allowNegative;
                byAccount.emplace(account->code, delta);
                it = accounts.emplace(account->code, *account).first;
            }
            byAccount[line.accountCode].amount +=
                domain::Money(line.amount().minor * it->second.signFor(line.side()));
        }

        std::vector<domain::BalanceDelta> deltas;
        for (auto& [code, delta] : byAccount) {
            if (!delta.amount.isZero()) {
                deltas.push_back(delta);
            }
        }

        posted.status = domain::EntryStatus::POSTED;
        posted.postedAt = domain::Timestamp::now();

        for (int attempt = 0;; ++attempt) {
            try {
                balanceRepo_->commitPosting(posted, deltas);
                return posted;
            } catch (const domain::LedgerException& e) {
                if (!e.isRetryable() || attempt >= settings_->maxCommitRetries) {
                    throw;
                }
                std::cerr << "[BalanceService] Commit of " << posted.entryId << " conflicted (attempt "
                          << attempt + 1 << "): " << e.what() << ", retrying" << std::endl;
            }
        }
    }

    domain::AccountBalance currentBalance(const std::string& accountCode) override {
        return rollUp(accountCode, "current", balanceRepo_->findAllMovements());
    }

    domain::AccountBalance balanceAsOf(const std::string& accountCode, const domain::Date& date) override {
        domain::EntryFilter filter;
        filter.statuses = {domain::EntryStatus::POSTED, domain::EntryStatus::ARCHIVED};
        filter.dateTo = date;
        return rollUp(accountCode, date.toString(), replay(filter));
    }

    domain::TrialBalance trialBalance(const std::string& periodId) override {
        auto period = periodRepo_->findPeriod(periodId);
        if (!period) {
            throw domain::LedgerException(domain::LedgerErrorCode::NOT_FOUND,
                "Period not found: " + periodId);
        }

        domain::EntryFilter filter;
        filter.statuses = {domain::EntryStatus::POSTED, domain::EntryStatus::ARCHIVED};
        filter.dateFrom = period->startDate;
        filter.dateTo = period->range().lastDay();

        std::map<std::string, std::pair<domain::Money, domain::Money>> turnover;
        for (const auto& entry : entryRepo_->find(filter)) {
            for (const auto& line : entry.lines) {
                auto& sides = turnover[line.accountCode];
                sides.first += line.debit;
                sides.second += line.credit;
            }
        }

        domain::TrialBalance report;
        report.periodId = periodId;
        for (const auto& account : accountRepo_->findAll()) {
            auto it = turnover.find(account.code);
            bool moved = it != turnover.end();
            if (!moved && !(account.isActive && account.allowPosting && !account.isAnalytic)) {
                continue;
            }

            domain::TrialBalanceRow row;
            row.accountCode = account.code;
            row.accountName = account.name;
            row.accountType = account.type;
            if (moved) {
                row.periodDebit = it->second.first;
                row.periodCredit = it->second.second;
            }
            auto net = row.periodDebit - row.periodCredit;
            if (net.isPositive()) {
                row.debit = net;
            } else {
                row.credit = -net;
            }

            report.totalDebit += row.debit;
            report.totalCredit += row.credit;
            report.totalPeriodDebit += row.periodDebit;
            report.totalPeriodCredit += row.periodCredit;
            report.rows.push_back(row);
        }

        std::sort(report.rows.begin(), report.rows.end(),
                  [](const domain::TrialBalanceRow& a, const domain::TrialBalanceRow& b) {
                      return a.accountCode < b.accountCode;
                  });

        if (!report.isBalanced()) {
            // Каждая проведённая проводка сбалансирована: расхождение означает порчу хранилища
            std::cerr << "[BalanceService] Trial balance for " << periodId << " is off: debit "
                      << report.totalPeriodDebit.toString() << " credit "
                      << report.totalPeriodCredit.toString() << std::endl;
            throw domain::LedgerException(domain::LedgerErrorCode::LEDGER_INCONSISTENT,
                "Trial balance for " + periodId + " is off: debit " + report.totalPeriodDebit.toString() +
                " credit " + report.totalPeriodCredit.toString());
        }
        return report;
    }

    std::vector<domain::BalanceDrift> findBalanceDrift() override {
        domain::EntryFilter filter;
        filter.statuses = {domain::EntryStatus::POSTED, domain::EntryStatus::ARCHIVED};
        auto replayed = replay(filter);
        auto stored = balanceRepo_->findAllMovements();

        std::set<std::string> codes;
        for (const auto& [code, amount] : replayed) codes.insert(code);
        for (const auto& [code, amount] : stored) codes.insert(code);

        std::vector<domain::BalanceDrift> drift;
        for (const auto& code : codes) {
            auto s = stored.count(code) ? stored.at(code) : domain::Money();
            auto r = replayed.count(code) ? replayed.at(code) : domain::Money();
            if (s != r) {
                drift.push_back({code, s, r});
            }
        }

        if (!drift.empty()) {
            std::cerr << "[BalanceService] Balance drift on " << drift.size() << " accounts" << std::endl;
        }
        return drift;
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IJournalEntryRepository> entryRepo_;
    std::shared_ptr<ports::output::IBalanceRepository> balanceRepo_;
    std::shared_ptr<ports::output::IPeriodRepository> periodRepo_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    /// Собственное движение по счетам из проводок, прошедших фильтр
    std::map<std::string, domain::Money> replay(const domain::EntryFilter& filter) {
        std::map<std::string, domain::Account> accounts;
        for (auto& account : accountRepo_->findAll()) {
            accounts.emplace(account.code, std::move(account));
        }

        std::map<std::string, domain::Money> movement;
        for (const auto& entry : entryRepo_->find(filter)) {
            for (const auto& line : entry.lines) {
                auto it = accounts.find(line.accountCode);
                if (it == accounts.end()) {
                    throw domain::LedgerException(domain::LedgerErrorCode::UNKNOWN_ACCOUNT,
                        "Entry " + entry.entryId + " references unknown account " + line.accountCode);
                }
                movement[line.accountCode] += domain::Money(line.amount().minor * it->second.signFor(line.side()));
            }
        }
        return movement;
    }

    domain::AccountBalance rollUp(const std::string& accountCode, const std::string& asOf,
                                  const std::map<std::string, domain::Money>& movement) {
        auto all = accountRepo_->findAll();
        std::map<std::string, const domain::Account*> byCode;
        std::multimap<std::string, const domain::Account*> children;
        for (const auto& account : all) {
            byCode[account.code] = &account;
            if (account.parentCode) {
                children.emplace(*account.parentCode, &account);
            }
        }

        auto rootIt = byCode.find(accountCode);
        if (rootIt == byCode.end()) {
            throw domain::LedgerException(domain::LedgerErrorCode::NOT_FOUND,
                "Account not found: " + accountCode);
        }
        const auto& root = *rootIt->second;

        auto ownOf = [&movement](const domain::Account& account) {
            auto it = movement.find(account.code);
            return account.openingBalance + (it == movement.end() ? domain::Money() : it->second);
        };

        domain::AccountBalance result;
        result.accountCode = root.code;
        result.asOf = asOf;
        result.normalSide = root.normalSide();
        result.ownBalance = ownOf(root);
        result.balance = result.ownBalance;

        std::set<std::string> visited{root.code};
        std::vector<const domain::Account*> stack{&root};
        while (!stack.empty()) {
            auto current = stack.back();
            stack.pop_back();
            auto range = children.equal_range(current->code);
            for (auto it = range.first; it != range.second; ++it) {
                const auto& child = *it->second;
                if (!visited.insert(child.code).second) continue;
                auto own = ownOf(child);
                result.balance += child.normalSide() == root.normalSide() ? own : -own;
                stack.push_back(&child);
            }
        }
        return result;
    }
};

} // namespace ledger::application
