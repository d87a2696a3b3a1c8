#pragma once

#include "domain/Journal.hpp"
#include "domain/enums/JournalType.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::input {

struct CreateJournalRequest {
    std::string code;
    std::string name;
    domain::JournalType type = domain::JournalType::GENERAL;
    std::string description;
    bool isDefault = false;
    std::optional<std::string> defaultDebitAccount;
    std::optional<std::string> defaultCreditAccount;
};

/**
 * @brief Изменяемые поля журнала (код и тип не меняются)
 *
 * Пустая строка в defaultDebitAccount/defaultCreditAccount снимает счёт по умолчанию.
 */
struct UpdateJournalRequest {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<bool> isDefault;
    std::optional<std::string> defaultDebitAccount;
    std::optional<std::string> defaultCreditAccount;
};

struct JournalFilter {
    std::optional<domain::JournalType> type;
    std::optional<bool> active;
};

/**
 * @brief Справочник журналов
 */
class IJournalRegistryService {
public:
    virtual ~IJournalRegistryService() = default;

    /**
     * @throws domain::LedgerException DUPLICATE_CODE, INVALID_ARGUMENT,
     *         UNKNOWN_ACCOUNT, ACCOUNT_NOT_POSTABLE
     */
    virtual domain::Journal createJournal(const CreateJournalRequest& request) = 0;

    /**
     * @throws domain::LedgerException NOT_FOUND
     */
    virtual domain::Journal getJournal(const std::string& code) = 0;

    virtual std::vector<domain::Journal> listJournals(const JournalFilter& filter) = 0;

    virtual domain::Journal updateJournal(const std::string& code, const UpdateJournalRequest& request) = 0;

    /**
     * @throws domain::LedgerException INVALID_STATE для журнала по умолчанию
     */
    virtual domain::Journal deactivate(const std::string& code) = 0;
    virtual domain::Journal reactivate(const std::string& code) = 0;

    /**
     * @brief Журнал для новой проводки
     *
     * Без кода: журнал по умолчанию.
     * @throws domain::LedgerException UNKNOWN_JOURNAL если журнал не найден или неактивен
     */
    virtual domain::Journal resolveForPosting(const std::optional<std::string>& code) = 0;

    /// AC, VT, BQ, OD (по умолчанию); существующие коды пропускаются
    virtual int seedDefaultJournals() = 0;
};

} // namespace ledger::ports::input
