#pragma once

#include "EntrySide.hpp"
#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Класс счёта в плане счетов
 *
 * Определяет нормальную сторону сальдо:
 * - ASSET, EXPENSE: дебетовые
 * - LIABILITY, EQUITY, REVENUE: кредитовые
 */
enum class AccountType {
    ASSET,
    LIABILITY,
    EQUITY,
    REVENUE,
    EXPENSE
};

inline std::string toString(AccountType type) {
    switch (type) {
        case AccountType::ASSET:     return "ASSET";
        case AccountType::LIABILITY: return "LIABILITY";
        case AccountType::EQUITY:    return "EQUITY";
        case AccountType::REVENUE:   return "REVENUE";
        case AccountType::EXPENSE:   return "EXPENSE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Преобразовать строку в AccountType
 *
 * Принимает также французские названия из старого плана счетов
 * (actif, passif, capitaux_propres, produit, charge).
 *
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountType parseAccountType(const std::string& str) {
    if (str == "ASSET" || str == "asset" || str == "actif")            return AccountType::ASSET;
    if (str == "LIABILITY" || str == "liability" || str == "passif")   return AccountType::LIABILITY;
    if (str == "EQUITY" || str == "equity" || str == "capitaux_propres") return AccountType::EQUITY;
    if (str == "REVENUE" || str == "revenue" || str == "produit")      return AccountType::REVENUE;
    if (str == "EXPENSE" || str == "expense" || str == "charge")       return AccountType::EXPENSE;
    throw std::invalid_argument("Unknown account type: " + str);
}

inline EntrySide normalSideOf(AccountType type) {
    switch (type) {
        case AccountType::ASSET:
        case AccountType::EXPENSE:
            return EntrySide::DEBIT;
        default:
            return EntrySide::CREDIT;
    }
}

/// Счета результата обнуляются при закрытии финансового года
inline bool isIncomeStatementType(AccountType type) {
    return type == AccountType::REVENUE || type == AccountType::EXPENSE;
}

} // namespace ledger::domain
