#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Сторона проводки: дебет или кредит
 */
enum class EntrySide {
    DEBIT,
    CREDIT
};

inline std::string toString(EntrySide side) {
    switch (side) {
        case EntrySide::DEBIT:  return "DEBIT";
        case EntrySide::CREDIT: return "CREDIT";
        default: return "UNKNOWN";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline EntrySide parseEntrySide(const std::string& str) {
    if (str == "DEBIT" || str == "debit")   return EntrySide::DEBIT;
    if (str == "CREDIT" || str == "credit") return EntrySide::CREDIT;
    throw std::invalid_argument("Unknown entry side: " + str);
}

inline EntrySide opposite(EntrySide side) {
    return side == EntrySide::DEBIT ? EntrySide::CREDIT : EntrySide::DEBIT;
}

} // namespace ledger::domain
