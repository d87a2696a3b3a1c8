#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/enums/EntrySide.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Строка во входном запросе
 *
 * Оба поля debit и credit принимаются как есть, чтобы валидация
 * могла отклонить двустороннюю строку (BOTH_SIDES_NONZERO).
 * Пустой accountCode: счёт журнала по умолчанию для стороны строки.
 */
struct LineRequest {
    std::string accountCode;
    domain::Money debit;
    domain::Money credit;
    std::optional<std::string> analyticAccount;
    std::string description;

    static LineRequest of(const std::string& accountCode, domain::EntrySide side, int64_t amount,
                          const std::string& description = "") {
        LineRequest line;
        line.accountCode = accountCode;
        if (side == domain::EntrySide::DEBIT) {
            line.debit = domain::Money(amount);
        } else {
            line.credit = domain::Money(amount);
        }
        line.description = description;
        return line;
    }
};

struct NewEntryRequest {
    std::optional<std::string> journalCode;  ///< пусто: журнал по умолчанию
    domain::Date date;
    std::string reference;
    std::string description;
    std::string createdBy;
    std::vector<LineRequest> lines;
};

/**
 * @brief Движок проводок
 *
 * DRAFT --addLine/removeLine--> DRAFT --validateBalance--> BALANCED --post--> POSTED
 * POSTED --reverse--> новая POSTED проводка; POSTED --archive--> ARCHIVED
 */
class IJournalService {
public:
    virtual ~IJournalService() = default;

    /**
     * @brief Черновик; строки из запроса добавляются через addLine
     * @throws domain::LedgerException UNKNOWN_JOURNAL
     */
    virtual domain::JournalEntry createDraft(const NewEntryRequest& request) = 0;

    virtual domain::JournalEntry addLine(const std::string& entryId, const LineRequest& line) = 0;
    virtual domain::JournalEntry removeLine(const std::string& entryId, int lineNumber) = 0;

    /// Пустой validatedBy: автор проводки
    virtual domain::JournalEntry validateBalance(const std::string& entryId, const std::string& validatedBy) = 0;

    /**
     * @param postedBy пусто: автор проводки
     * @throws domain::LedgerException UNBALANCED, PERIOD_CLOSED, INVALID_STATE,
     *         UNKNOWN_ACCOUNT, NEGATIVE_BALANCE
     */
    virtual domain::JournalEntry post(const std::string& entryId, const std::string& postedBy) = 0;

    /// Черновик + строки + проверка баланса + проведение одним вызовом (postedBy = createdBy)
    virtual domain::JournalEntry createAndPost(const NewEntryRequest& request) = 0;

    /// @return новая (сторнирующая) проводка в том же журнале
    virtual domain::JournalEntry reverse(const std::string& entryId,
                                         const std::optional<domain::Date>& date,
                                         const std::string& createdBy) = 0;

    virtual domain::JournalEntry archive(const std::string& entryId) = 0;

    /**
     * @brief Закрывающая проводка финансового года
     *
     * Не проверяет открытость периода (к этому моменту периоды закрыты),
     * но требует, чтобы год ещё не был закрыт. Без journalCode идёт
     * в журнал по умолчанию.
     * Вызывающий обязан держать эксклюзивные блокировки периодов года.
     */
    virtual domain::JournalEntry postClosingEntry(const NewEntryRequest& request) = 0;

    virtual domain::JournalEntry getEntry(const std::string& entryId) = 0;
    virtual std::vector<domain::JournalEntry> listEntries(const domain::EntryFilter& filter) = 0;
};

} // namespace ledger::ports::input
