#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Статус проводки (journal entry)
 *
 * Переходы только вперёд:
 *   DRAFT → BALANCED → POSTED → ARCHIVED
 *
 * REVERSED присутствует в формате обмена, но сервис его не выставляет:
 * сторнированная проводка остаётся POSTED, связь хранит сторнирующая
 * проводка (поле reversalOf).
 */
enum class EntryStatus {
    DRAFT,
    BALANCED,
    POSTED,
    ARCHIVED,
    REVERSED
};

inline std::string toString(EntryStatus status) {
    switch (status) {
        case EntryStatus::DRAFT:    return "DRAFT";
        case EntryStatus::BALANCED: return "BALANCED";
        case EntryStatus::POSTED:   return "POSTED";
        case EntryStatus::ARCHIVED: return "ARCHIVED";
        case EntryStatus::REVERSED: return "REVERSED";
        default: return "UNKNOWN";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline EntryStatus parseEntryStatus(const std::string& str) {
    if (str == "DRAFT" || str == "draft")       return EntryStatus::DRAFT;
    if (str == "BALANCED" || str == "balanced") return EntryStatus::BALANCED;
    if (str == "POSTED" || str == "posted")     return EntryStatus::POSTED;
    if (str == "ARCHIVED" || str == "archived") return EntryStatus::ARCHIVED;
    if (str == "REVERSED" || str == "reversed") return EntryStatus::REVERSED;
    throw std::invalid_argument("Unknown entry status: " + str);
}

/// Проводка уже отражена в сальдо счетов
inline bool affectsBalances(EntryStatus status) {
    return status == EntryStatus::POSTED || status == EntryStatus::ARCHIVED;
}

/// Проводка ещё не проведена и блокирует закрытие периода
inline bool isPending(EntryStatus status) {
    return status == EntryStatus::DRAFT || status == EntryStatus::BALANCED;
}

} // namespace ledger::domain
