#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/Balance.hpp"
#include "domain/Date.hpp"
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Агрегатор сальдо счетов
 */
class IBalanceService {
public:
    virtual ~IBalanceService() = default;

    /**
     * @brief Атомарно провести проводку и обновить сальдо затронутых счетов
     *
     * entry должна быть сбалансирована; статус и postedAt выставляются здесь.
     * @return проведённая проводка
     */
    virtual domain::JournalEntry applyPostedEntry(const domain::JournalEntry& entry) = 0;

    /// Текущее сальдо по инкрементальному хранилищу (с потомками)
    virtual domain::AccountBalance currentBalance(const std::string& accountCode) = 0;

    /// Входящее сальдо + все проведённые строки с датой <= date (с потомками)
    virtual domain::AccountBalance balanceAsOf(const std::string& accountCode, const domain::Date& date) = 0;

    virtual domain::TrialBalance trialBalance(const std::string& periodId) = 0;

    /// Счета, где инкрементальное сальдо не совпало с полным пересчётом
    virtual std::vector<domain::BalanceDrift> findBalanceDrift() = 0;
};

} // namespace ledger::ports::input
