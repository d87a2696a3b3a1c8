#pragma once

#include "enums/JournalType.hpp"
#include "enums/EntrySide.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>

namespace ledger::domain {

/**
 * @brief Журнал (книга проводок): продажи, покупки, банк, прочие
 *
 * Каждая проводка относится ровно к одному журналу. Журнал может задавать
 * счета по умолчанию: строка без кода счёта получает счёт своей стороны.
 * Не более одного журнала помечено isDefault: в него попадают проводки
 * без явного journalCode, включая закрывающие.
 */
struct Journal {
    std::string code;                               ///< "VT", "AC", "BQ", "OD"
    std::string name;
    JournalType type = JournalType::GENERAL;
    std::string description;
    bool isDefault = false;
    bool isActive = true;
    std::optional<std::string> defaultDebitAccount;
    std::optional<std::string> defaultCreditAccount;
    Timestamp createdAt;
    Timestamp updatedAt;

    Journal() = default;

    Journal(const std::string& code, const std::string& name, JournalType type)
        : code(code)
        , name(name)
        , type(type)
    {}

    std::optional<std::string> defaultAccountFor(EntrySide side) const {
        return side == EntrySide::DEBIT ? defaultDebitAccount : defaultCreditAccount;
    }
};

} // namespace ledger::domain
