#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Тип журнала (книги проводок)
 */
enum class JournalType {
    PURCHASE,
    SALES,
    TREASURY,       ///< Банк и касса
    GENERAL,
    MISCELLANEOUS   ///< Операции разные (OD)
};

inline std::string toString(JournalType type) {
    switch (type) {
        case JournalType::PURCHASE:      return "PURCHASE";
        case JournalType::SALES:         return "SALES";
        case JournalType::TREASURY:      return "TREASURY";
        case JournalType::GENERAL:       return "GENERAL";
        case JournalType::MISCELLANEOUS: return "MISCELLANEOUS";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Преобразовать строку в JournalType
 *
 * Принимает также французские названия (achat, vente, tresorerie, general, od).
 *
 * @throws std::invalid_argument если строка не распознана
 */
inline JournalType parseJournalType(const std::string& str) {
    if (str == "PURCHASE" || str == "purchase" || str == "achat")        return JournalType::PURCHASE;
    if (str == "SALES" || str == "sales" || str == "vente")              return JournalType::SALES;
    if (str == "TREASURY" || str == "treasury" || str == "tresorerie")   return JournalType::TREASURY;
    if (str == "GENERAL" || str == "general")                           return JournalType::GENERAL;
    if (str == "MISCELLANEOUS" || str == "miscellaneous" || str == "od") return JournalType::MISCELLANEOUS;
    throw std::invalid_argument("Unknown journal type: " + str);
}

} // namespace ledger::domain
