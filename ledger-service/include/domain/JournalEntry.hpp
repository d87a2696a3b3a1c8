#pragma once

#include "enums/EntryStatus.hpp"
#include "enums/EntrySide.hpp"
#include "Money.hpp"
#include "Date.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace ledger::domain {

/**
 * @brief Строка проводки
 *
 * Ровно одна из сумм debit/credit ненулевая.
 */
struct JournalEntryLine {
    int lineNumber = 0;
    std::string accountCode;
    std::optional<std::string> analyticAccount;  ///< Центр затрат (необязательно)
    Money debit;
    Money credit;
    std::string description;

    JournalEntryLine() = default;

    JournalEntryLine(const std::string& accountCode, EntrySide side, Money amount,
                     const std::string& description = "")
        : accountCode(accountCode)
        , debit(side == EntrySide::DEBIT ? amount : Money())
        , credit(side == EntrySide::CREDIT ? amount : Money())
        , description(description)
    {}

    EntrySide side() const { return debit.isZero() ? EntrySide::CREDIT : EntrySide::DEBIT; }

    Money amount() const { return debit.isZero() ? credit : debit; }

    /// Та же строка с переставленными сторонами (для сторно)
    JournalEntryLine swapped() const {
        JournalEntryLine line = *this;
        std::swap(line.debit, line.credit);
        return line;
    }
};

/**
 * @brief Бухгалтерская проводка (journal entry)
 *
 * Создаётся в DRAFT, двигается только вперёд. После POSTED неизменна:
 * исправления: только новой сторнирующей проводкой.
 */
struct JournalEntry {
    std::string entryId;                    ///< "JE-000001", никогда не переиспользуется
    std::string journalCode;                ///< Журнал ("VT", "OD")
    Date date;
    std::string reference;
    std::string description;
    std::vector<JournalEntryLine> lines;
    EntryStatus status = EntryStatus::DRAFT;
    Money totalDebit;                       ///< Кэш Σdebit
    Money totalCredit;                      ///< Кэш Σcredit
    std::string createdBy;
    Timestamp createdAt;
    std::optional<std::string> validatedBy;
    std::optional<Timestamp> validatedAt;
    std::optional<std::string> postedBy;
    std::optional<Timestamp> postedAt;
    std::optional<std::string> reversalOf;  ///< Какую проводку сторнирует
    bool closing = false;                   ///< Закрывающая проводка финансового года

    void recomputeTotals() {
        totalDebit = Money();
        totalCredit = Money();
        for (const auto& line : lines) {
            totalDebit += line.debit;
            totalCredit += line.credit;
        }
    }

    bool isBalanced() const {
        return lines.size() >= 2 && totalDebit == totalCredit;
    }

    bool isEditable() const { return status == EntryStatus::DRAFT; }

    int nextLineNumber() const {
        int maxNumber = 0;
        for (const auto& line : lines) {
            if (line.lineNumber > maxNumber) maxNumber = line.lineNumber;
        }
        return maxNumber + 1;
    }
};

/**
 * @brief Фильтр выборки проводок
 */
struct EntryFilter {
    std::vector<EntryStatus> statuses;      ///< пусто: любые
    std::optional<Date> dateFrom;           ///< включительно
    std::optional<Date> dateTo;             ///< включительно
    std::optional<std::string> accountCode; ///< хотя бы одна строка по счёту
    std::optional<std::string> reversalOf;
    std::optional<std::string> journalCode;

    bool matches(const JournalEntry& entry) const {
        if (!statuses.empty()) {
            bool found = false;
            for (auto status : statuses) {
                if (entry.status == status) { found = true; break; }
            }
            if (!found) return false;
        }
        if (dateFrom && entry.date < *dateFrom) return false;
        if (dateTo && entry.date > *dateTo) return false;
        if (reversalOf && entry.reversalOf != reversalOf) return false;
        if (journalCode && entry.journalCode != *journalCode) return false;
        if (accountCode) {
            for (const auto& line : entry.lines) {
                if (line.accountCode == *accountCode) return true;
            }
            return false;
        }
        return true;
    }
};

} // namespace ledger::domain
