#pragma once

#include "domain/JournalEntry.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Хранилище проводок
 *
 * Проведение (DRAFT/BALANCED → POSTED) здесь не выполняется:
 * это делает IBalanceRepository::commitPosting вместе с сальдо.
 */
class IJournalEntryRepository {
public:
    virtual ~IJournalEntryRepository() = default;

    /// Следующий номер проводки "JE-000001"; номера не переиспользуются
    virtual std::string nextEntryId() = 0;

    /**
     * @brief Сохранить черновик (DRAFT/BALANCED)
     * @throws domain::LedgerException INVALID_STATE если в хранилище
     *         проводка уже проведена
     */
    virtual domain::JournalEntry saveDraft(const domain::JournalEntry& entry) = 0;

    virtual std::optional<domain::JournalEntry> findById(const std::string& entryId) = 0;

    /// Отсортированы по дате, затем по номеру
    virtual std::vector<domain::JournalEntry> find(const domain::EntryFilter& filter) = 0;

    /**
     * @brief POSTED → ARCHIVED для проводок в диапазоне дат [from, to]
     * @return количество архивированных
     */
    virtual int archive(const domain::Date& from, const domain::Date& to) = 0;

    /// POSTED → ARCHIVED одной проводки; false если статус уже не POSTED
    virtual bool archiveEntry(const std::string& entryId) = 0;
};

} // namespace ledger::ports::output
