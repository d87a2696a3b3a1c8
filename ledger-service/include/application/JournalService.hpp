#pragma once

#include "ports/input/IJournalService.hpp"
#include "ports/input/IPeriodService.hpp"
#include "ports/input/IBalanceService.hpp"
#include "ports/input/IJournalRegistryService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IJournalEntryRepository.hpp"
#include "application/PeriodGate.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/LedgerException.hpp"
#include <memory>
#include <iostream>
#include <array>
#include <algorithm>
#include <mutex>
#include <functional>

namespace ledger::application {

/**
 * @brief Движок проводок
 *
 * Проведение:
 * 1. Пересчёт итогов и проверка баланса (UNBALANCED)
 * 2. Повторная проверка счетов строк
 * 3. Разделяемая блокировка периода + проверка открытости (PERIOD_CLOSED)
 * 4. Один атомарный коммит через IBalanceService::applyPostedEntry
 *
 * createAndPost и reverse собирают проводку в памяти и сохраняют её
 * только этим коммитом: при любой ошибке в хранилище ничего не остаётся.
 *
 * Журнал проверяется при создании проводки; сторно наследует журнал
 * оригинала, даже если тот с тех пор деактивирован.
 */
class JournalService : public ports::input::IJournalService {
public:
    JournalService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IJournalEntryRepository> entryRepo,
        std::shared_ptr<ports::input::IPeriodService> periodService,
        std::shared_ptr<ports::input::IBalanceService> balanceService,
        std::shared_ptr<ports::input::IJournalRegistryService> journals,
        std::shared_ptr<PeriodGate> gate,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : accountRepo_(std::move(accountRepo))
      , entryRepo_(std::move(entryRepo))
      , periodService_(std::move(periodService))
      , balanceService_(std::move(balanceService))
      , journals_(std::move(journals))
      , gate_(std::move(gate))
      , settings_(std::move(settings))
    {
        std::cout << "[JournalService] Created" << std::endl;
    }

    domain::JournalEntry createDraft(const ports::input::NewEntryRequest& request) override {
        auto entry = buildEntry(request);

        auto period = periodService_->findPeriodForDate(entry.date);
        if (!period) {
            throw domain::LedgerException(domain::LedgerErrorCode::PERIOD_CLOSED,
                "No accounting period covers " + entry.date.toString());
        }

        // Под разделяемой блокировкой: closePeriod не пропустит черновик,
        // сохранённый параллельно с его проверкой
        auto access = gate_->shared(period->id);
        if (periodService_->getPeriod(period->id).isClosed) {
            throw domain::LedgerException(domain::LedgerErrorCode::PERIOD_CLOSED,
                "Period " + period->id + " is closed");
        }

        auto saved = entryRepo_->saveDraft(entry);
        std::cout << "[JournalService] Draft " << saved.entryId << " created in " << saved.journalCode
                  << ", " << saved.lines.size() << " lines" << std::endl;
        return saved;
    }

    domain::JournalEntry addLine(const std::string& entryId, const ports::input::LineRequest& request) override {
        std::lock_guard<std::mutex> lock(entryLock(entryId));
        auto entry = requireEditable(entryId);

        auto line = buildLine(request, false, journals_->getJournal(entry.journalCode));
        line.lineNumber = entry.nextLineNumber();
        entry.lines.push_back(line);
        entry.recomputeTotals();

        return entryRepo_->saveDraft(entry);
    }

    domain::JournalEntry removeLine(const std::string& entryId, int lineNumber) override {
        std::lock_guard<std::mutex> lock(entryLock(entryId));
        auto entry = requireEditable(entryId);

        auto it = std::find_if(entry.lines.begin(), entry.lines.end(),
                               [lineNumber](const domain::JournalEntryLine& l) { return l.lineNumber == lineNumber; });
        if (it == entry.lines.end()) {
            throw domain::LedgerException(domain::LedgerErrorCode::NOT_FOUND,
                "Line " + std::to_string(lineNumber) + " not found in " + entryId);
        }
        entry.lines.erase(it);
        entry.recomputeTotals();

        return entryRepo_->saveDraft(entry);
    }

    domain::JournalEntry validateBalance(const std::string& entryId, const std::string& validatedBy) override {
        std::lock_guard<std::mutex> lock(entryLock(entryId));
        auto entry = getEntry(entryId);

        if (entry.status == domain::EntryStatus::BALANCED) {
            return entry;
        }
        if (entry.status != domain::EntryStatus::DRAFT) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Entry " + entryId + " is " + domain::toString(entry.status));
        }

        requireBalanced(entry);
        entry.status = domain::EntryStatus::BALANCED;
        markValidated(entry, validatedBy);
        return entryRepo_->saveDraft(entry);
    }

    domain::JournalEntry post(const std::string& entryId, const std::string& postedBy) override {
        std::lock_guard<std::mutex> lock(entryLock(entryId));
        auto entry = getEntry(entryId);

        if (!domain::isPending(entry.status)) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Entry " + entryId + " is " + domain::toString(entry.status) + ", cannot post");
        }
        // Черновик проверяется прямо при проведении
        if (!entry.validatedBy) {
            markValidated(entry, postedBy);
        }
        entry.postedBy = postedBy.empty() ? entry.createdBy : postedBy;
        return postThroughOpenPeriod(entry);
    }

    domain::JournalEntry createAndPost(const ports::input::NewEntryRequest& request) override {
        auto entry = buildEntry(request);
        markValidated(entry, entry.createdBy);
        entry.postedBy = entry.createdBy;
        return postThroughOpenPeriod(entry);
    }

    domain::JournalEntry reverse(const std::string& entryId,
                                 const std::optional<domain::Date>& date,
                                 const std::string& createdBy) override {
        // Два параллельных сторно одной проводки сериализуются здесь
        std::lock_guard<std::mutex> lock(entryLock(entryId));
        auto original = getEntry(entryId);

        if (original.status != domain::EntryStatus::POSTED) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Only POSTED entries can be reversed, " + entryId + " is " + domain::toString(original.status));
        }

        domain::EntryFilter existing;
        existing.reversalOf = entryId;
        auto reversals = entryRepo_->find(existing);
        if (!reversals.empty()) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Entry " + entryId + " already reversed by " + reversals.front().entryId);
        }

        auto reversalDate = date.value_or(original.date);
        if (reversalDate < original.date) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_ARGUMENT,
                "Reversal date " + reversalDate.toString() + " precedes original " + original.date.toString());
        }

        domain::JournalEntry reversal;
        reversal.entryId = entryRepo_->nextEntryId();
        reversal.journalCode = original.journalCode;
        reversal.date = reversalDate;
        reversal.reference = original.entryId;
        reversal.description = "Reversal of " + original.entryId +
                               (original.description.empty() ? "" : ": " + original.description);
        reversal.createdBy = createdBy.empty() ? original.createdBy : createdBy;
        reversal.createdAt = domain::Timestamp::now();
        reversal.reversalOf = original.entryId;
        for (const auto& line : original.lines) {
            reversal.lines.push_back(line.swapped());
        }
        markValidated(reversal, reversal.createdBy);
        reversal.postedBy = reversal.createdBy;

        auto posted = postThroughOpenPeriod(reversal);
        std::cout << "[JournalService] " << posted.entryId << " reverses " << entryId << std::endl;
        return posted;
    }

    domain::JournalEntry archive(const std::string& entryId) override {
        std::lock_guard<std::mutex> lock(entryLock(entryId));
        auto entry = getEntry(entryId);

        if (entry.status != domain::EntryStatus::POSTED) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Only POSTED entries can be archived, " + entryId + " is " + domain::toString(entry.status));
        }

        auto period = periodService_->findPeriodForDate(entry.date);
        if (period && !period->isClosed) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Cannot archive " + entryId + ": period " + period->id + " is still open");
        }

        if (!entryRepo_->archiveEntry(entryId)) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Entry " + entryId + " changed state concurrently");
        }

        std::cout << "[JournalService] Archived " << entryId << std::endl;
        return getEntry(entryId);
    }

    domain::JournalEntry postClosingEntry(const ports::input::NewEntryRequest& request) override {
        auto entry = buildEntry(request, true);
        entry.closing = true;
        markValidated(entry, entry.createdBy);
        entry.postedBy = entry.createdBy;

        auto period = periodService_->findPeriodForDate(entry.date);
        if (!period) {
            throw domain::LedgerException(domain::LedgerErrorCode::PERIOD_CLOSED,
                "No accounting period covers " + entry.date.toString());
        }
        auto year = periodService_->getFiscalYear(period->fiscalYearId);
        if (year.isClosed) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Fiscal year " + year.id + " is already closed");
        }

        requireBalanced(entry);
        auto posted = balanceService_->applyPostedEntry(entry);

        std::cout << "[JournalService] Posted closing entry " << posted.entryId
                  << " amount=" << posted.totalDebit.toString(settings_->currencyScale) << std::endl;
        return posted;
    }

    domain::JournalEntry getEntry(const std::string& entryId) override {
        auto entry = entryRepo_->findById(entryId);
        if (!entry) {
            throw domain::LedgerException(domain::LedgerErrorCode::NOT_FOUND,
                "Journal entry not found: " + entryId);
        }
        return *entry;
    }

    std::vector<domain::JournalEntry> listEntries(const domain::EntryFilter& filter) override {
        return entryRepo_->find(filter);
    }

private:
    static constexpr size_t LOCK_STRIPES = 64;

    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IJournalEntryRepository> entryRepo_;
    std::shared_ptr<ports::input::IPeriodService> periodService_;
    std::shared_ptr<ports::input::IBalanceService> balanceService_;
    std::shared_ptr<ports::input::IJournalRegistryService> journals_;
    std::shared_ptr<PeriodGate> gate_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::array<std::mutex, LOCK_STRIPES> entryLocks_;

    std::mutex& entryLock(const std::string& entryId) {
        return entryLocks_[std::hash<std::string>{}(entryId) % LOCK_STRIPES];
    }

    domain::JournalEntry requireEditable(const std::string& entryId) {
        auto entry = getEntry(entryId);
        if (!entry.isEditable()) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Entry " + entryId + " is " + domain::toString(entry.status) + ", lines are frozen");
        }
        return entry;
    }

    static void markValidated(domain::JournalEntry& entry, const std::string& validatedBy) {
        entry.validatedBy = validatedBy.empty() ? entry.createdBy : validatedBy;
        entry.validatedAt = domain::Timestamp::now();
    }

    static void requireBalanced(domain::JournalEntry& entry) {
        entry.recomputeTotals();
        if (entry.lines.size() < 2) {
            throw domain::LedgerException(domain::LedgerErrorCode::UNBALANCED,
                "Entry " + entry.entryId + " needs at least two lines, has " + std::to_string(entry.lines.size()));
        }
        if (entry.totalDebit != entry.totalCredit) {
            throw domain::LedgerException(domain::LedgerErrorCode::UNBALANCED,
                "Entry " + entry.entryId + " is unbalanced: debit " + entry.totalDebit.toString() +
                " != credit " + entry.totalCredit.toString());
        }
    }

    domain::JournalEntry buildEntry(const ports::input::NewEntryRequest& request, bool closing = false) {
        auto journal = journals_->resolveForPosting(request.journalCode);

        domain::JournalEntry entry;
        entry.journalCode = journal.code;
        entry.date = request.date;
        entry.reference = request.reference;
        entry.description = request.description;
        entry.createdBy = request.createdBy;
        entry.createdAt = domain::Timestamp::now();

        for (const auto& lineRequest : request.lines) {
            auto line = buildLine(lineRequest, closing, journal);
            line.lineNumber = entry.nextLineNumber();
            entry.lines.push_back(line);
        }
        entry.recomputeTotals();

        // Номер берётся после валидации строк, но до проверки баланса
        entry.entryId = entryRepo_->nextEntryId();
        return entry;
    }

    /**
     * @brief Проверить строку и собрать её
     *
     * @param closing закрывающая проводка: допускает неактивные счета,
     *        у которых ещё осталось сальдо, и суммы ниже минимума строки
     * @param journal журнал проводки: подставляет счёт, если код не указан
     */
    domain::JournalEntryLine buildLine(ports::input::LineRequest request, bool closing,
                                       const domain::Journal& journal) {
        if (request.accountCode.empty()) {
            auto side = request.credit.isZero() ? domain::EntrySide::DEBIT : domain::EntrySide::CREDIT;
            if (auto fallback = journal.defaultAccountFor(side)) {
                request.accountCode = *fallback;
            } else {
                throw domain::LedgerException(domain::LedgerErrorCode::INVALID_ARGUMENT,
                    "Line has no account and journal " + journal.code + " has no default " +
                    domain::toString(side) + " account");
            }
        }
        requirePostable(request.accountCode, request.analyticAccount, closing);

        if (request.debit.isNegative() || request.credit.isNegative()) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_AMOUNT,
                "Negative amount on account " + request.accountCode);
        }
        if (!request.debit.isZero() && !request.credit.isZero()) {
            throw domain::LedgerException(domain::LedgerErrorCode::BOTH_SIDES_NONZERO,
                "Line on " + request.accountCode + " has both debit and credit");
        }

        auto amount = request.debit.isZero() ? request.credit : request.debit;
        const int64_t minimum = closing ? 1 : settings_->minLineAmount;
        if (amount.minor < minimum) {
            throw domain::LedgerException(domain::LedgerErrorCode::ZERO_AMOUNT,
                "Line on " + request.accountCode + " has amount " + amount.toString() +
                ", minimum is " + std::to_string(minimum));
        }

        domain::JournalEntryLine line;
        line.accountCode = request.accountCode;
        line.analyticAccount = request.analyticAccount;
        line.debit = request.debit;
        line.credit = request.credit;
        line.description = request.description;
        return line;
    }

    void requirePostable(const std::string& code, const std::optional<std::string>& analytic, bool allowInactive) {
        auto account = accountRepo_->findByCode(code);
        if (!account || (!account->isActive && !allowInactive)) {
            throw domain::LedgerException(domain::LedgerErrorCode::UNKNOWN_ACCOUNT,
                account ? "Account is inactive: " + code : "Unknown account: " + code);
        }
        if (!account->allowPosting || account->isAnalytic) {
            throw domain::LedgerException(domain::LedgerErrorCode::ACCOUNT_NOT_POSTABLE,
                "Account " + code + " does not accept postings");
        }

        if (analytic) {
            auto tag = accountRepo_->findByCode(*analytic);
            if (!tag || !tag->isActive || !tag->isAnalytic) {
                throw domain::LedgerException(domain::LedgerErrorCode::UNKNOWN_ACCOUNT,
                    "Unknown analytic account: " + *analytic);
            }
        }
    }

    domain::JournalEntry postThroughOpenPeriod(domain::JournalEntry entry) {
        requireBalanced(entry);

        // Счета могли деактивировать после addLine
        for (const auto& line : entry.lines) {
            requirePostable(line.accountCode, line.analyticAccount, false);
        }

        auto period = periodService_->findPeriodForDate(entry.date);
        if (!period) {
            throw domain::LedgerException(domain::LedgerErrorCode::PERIOD_CLOSED,
                "No accounting period covers " + entry.date.toString());
        }

        auto access = gate_->shared(period->id);
        if (!periodService_->isOpenForPosting(entry.date)) {
            throw domain::LedgerException(domain::LedgerErrorCode::PERIOD_CLOSED,
                "Period " + period->id + " is closed or locked");
        }

        auto posted = balanceService_->applyPostedEntry(entry);
        std::cout << "[JournalService] Posted " << posted.entryId << " " << posted.date.toString()
                  << " amount=" << posted.totalDebit.toString(settings_->currencyScale) << std::endl;
        return posted;
    }
};

} // namespace ledger::application
