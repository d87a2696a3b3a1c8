#pragma once

#include "Money.hpp"
#include "enums/AccountType.hpp"
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Изменение текущего сальдо одного счёта при проведении проводки
 *
 * amount выражен на нормальной стороне счёта. Если allowNegative == false,
 * хранилище отклоняет коммит, когда openingBalance + движение < 0.
 */
struct BalanceDelta {
    std::string accountCode;
    Money amount;
    Money openingBalance;
    bool allowNegative = true;
};

/**
 * @brief Сальдо счёта на дату
 */
struct AccountBalance {
    std::string accountCode;
    std::string asOf;           ///< "YYYY-MM-DD" или "current"
    Money balance;              ///< На нормальной стороне, с учётом потомков
    Money ownBalance;           ///< Входящее сальдо + собственные строки, без потомков
    EntrySide normalSide = EntrySide::DEBIT;
};

/**
 * @brief Строка оборотно-сальдовой ведомости (trial balance)
 *
 * debit/credit: чистое сальдо за период, разнесённое на одну из сторон.
 * periodDebit/periodCredit: валовые обороты.
 */
struct TrialBalanceRow {
    std::string accountCode;
    std::string accountName;
    AccountType accountType = AccountType::ASSET;
    Money periodDebit;
    Money periodCredit;
    Money debit;
    Money credit;
};

/**
 * @brief Оборотно-сальдовая ведомость за период
 *
 * totalDebit/totalCredit: суммы чистых колонок строк.
 * totalPeriodDebit/totalPeriodCredit: валовые обороты всех проводок периода.
 */
struct TrialBalance {
    std::string periodId;
    std::vector<TrialBalanceRow> rows;
    Money totalDebit;
    Money totalCredit;
    Money totalPeriodDebit;
    Money totalPeriodCredit;

    bool isBalanced() const {
        return totalDebit == totalCredit && totalPeriodDebit == totalPeriodCredit;
    }
};

/**
 * @brief Расхождение инкрементального сальдо и полного пересчёта
 */
struct BalanceDrift {
    std::string accountCode;
    Money stored;
    Money replayed;
};

} // namespace ledger::domain
