#pragma once

#include "ports/input/IClosingService.hpp"
#include "ports/input/IJournalService.hpp"
#include "ports/input/IBalanceService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IJournalEntryRepository.hpp"
#include "ports/output/IPeriodRepository.hpp"
#include "application/PeriodGate.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/LedgerException.hpp"
#include <memory>
#include <iostream>
#include <algorithm>
#include <mutex>

namespace ledger::application {

/**
 * @brief Закрытие финансового года
 *
 * Для каждого счёта доходов/расходов с ненулевым сальдо на последний день
 * года проводится закрывающая проводка против счёта нераспределённой
 * прибыли. Балансовые счета переходят на следующий год без изменений.
 *
 * Повторный запуск после сбоя продолжает с места остановки:
 * уже обнулённые счета проводок не получают.
 */
class ClosingService : public ports::input::IClosingService {
public:
    static constexpr const char* CLOSING_USER = "system";

    ClosingService(
        std::shared_ptr<ports::output::IPeriodRepository> periodRepo,
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IJournalEntryRepository> entryRepo,
        std::shared_ptr<ports::input::IJournalService> journalService,
        std::shared_ptr<ports::input::IBalanceService> balanceService,
        std::shared_ptr<PeriodGate> gate,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : periodRepo_(std::move(periodRepo))
      , accountRepo_(std::move(accountRepo))
      , entryRepo_(std::move(entryRepo))
      , journalService_(std::move(journalService))
      , balanceService_(std::move(balanceService))
      , gate_(std::move(gate))
      , settings_(std::move(settings))
    {
        std::cout << "[ClosingService] Created" << std::endl;
    }

    ports::input::ClosingResult closeFiscalYear(const std::string& yearId,
                                                const std::optional<std::string>& retainedEarningsAccount) override {
        std::lock_guard<std::mutex> lock(closeMutex_);

        auto year = requireClosable(yearId);
        auto retained = requireRetainedEarnings(
            retainedEarningsAccount.value_or(settings_->retainedEarningsAccount));

        std::vector<std::string> periodIds;
        for (const auto& period : year.periods) {
            periodIds.push_back(period.id);
        }
        auto held = gate_->exclusiveAll(periodIds);

        // Состояние могло измениться, пока ждали блокировки периодов
        year = requireClosable(yearId);

        std::cout << "[ClosingService] Closing " << yearId << " into " << retained.code << std::endl;

        ports::input::ClosingResult result;
        result.fiscalYearId = yearId;
        result.retainedEarningsAccount = retained.code;

        auto accounts = accountRepo_->findAll();
        std::sort(accounts.begin(), accounts.end(),
                  [](const domain::Account& a, const domain::Account& b) { return a.code < b.code; });

        const auto lastDay = year.lastDay();
        for (const auto& account : accounts) {
            if (!domain::isIncomeStatementType(account.type)) continue;

            auto own = balanceService_->balanceAsOf(account.code, lastDay).ownBalance;
            if (own.isZero()) continue;

            // Доход на кредите увеличивает прибыль, расход на дебете уменьшает
            result.netIncome += account.type == domain::AccountType::REVENUE ? own : -own;

            auto posted = journalService_->postClosingEntry(
                closingRequest(yearId, lastDay, account, own, retained.code));
            result.closingEntryIds.push_back(posted.entryId);
        }

        year.isClosed = true;
        year.closedAt = domain::Timestamp::now();
        periodRepo_->saveFiscalYear(year);

        result.archivedEntries = entryRepo_->archive(year.startDate, lastDay);

        std::cout << "[ClosingService] Closed " << yearId
                  << ": closing entries=" << result.closingEntryIds.size()
                  << " net income=" << result.netIncome.toString(settings_->currencyScale)
                  << " archived=" << result.archivedEntries << std::endl;
        return result;
    }

private:
    std::shared_ptr<ports::output::IPeriodRepository> periodRepo_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IJournalEntryRepository> entryRepo_;
    std::shared_ptr<ports::input::IJournalService> journalService_;
    std::shared_ptr<ports::input::IBalanceService> balanceService_;
    std::shared_ptr<PeriodGate> gate_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::mutex closeMutex_;

    domain::FiscalYear requireClosable(const std::string& yearId) {
        auto year = periodRepo_->findFiscalYear(yearId);
        if (!year) {
            throw domain::LedgerException(domain::LedgerErrorCode::NOT_FOUND,
                "Fiscal year not found: " + yearId);
        }
        if (year->isClosed) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Fiscal year already closed: " + yearId);
        }
        for (const auto& period : year->periods) {
            if (!period.isClosed) {
                throw domain::LedgerException(domain::LedgerErrorCode::OPEN_PERIODS,
                    "Fiscal year " + yearId + " has open period " + period.id);
            }
        }
        // Сальдо на конец года накопительное: пока предыдущий год открыт,
        // его доходы и расходы попали бы в закрывающие проводки этого года
        for (const auto& other : periodRepo_->findAllFiscalYears()) {
            if (other.startDate < year->startDate && !other.isClosed) {
                throw domain::LedgerException(domain::LedgerErrorCode::OUT_OF_ORDER,
                    "Earlier fiscal year " + other.id + " must be closed before " + yearId);
            }
        }
        return *year;
    }

    domain::Account requireRetainedEarnings(const std::string& code) {
        auto account = accountRepo_->findByCode(code);
        if (!account) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_ARGUMENT,
                "Retained earnings account not found: " + code);
        }
        if (!account->isActive || account->type != domain::AccountType::EQUITY ||
            !account->allowPosting || account->isAnalytic) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_ARGUMENT,
                "Retained earnings account " + code + " must be an active postable EQUITY account");
        }
        return *account;
    }

    /**
     * @brief Проводка, обнуляющая собственное сальдо счёта
     *
     * Положительное сальдо снимается с нормальной стороны счёта,
     * отрицательное (например, сторно превысило выручку) с противоположной.
     */
    static ports::input::NewEntryRequest closingRequest(const std::string& yearId,
                                                        const domain::Date& date,
                                                        const domain::Account& account,
                                                        const domain::Money& own,
                                                        const std::string& retainedCode) {
        auto accountSide = own.isPositive() ? domain::opposite(account.normalSide()) : account.normalSide();
        auto amount = own.abs().minor;

        ports::input::NewEntryRequest request;
        request.date = date;
        request.reference = "CLOSING-" + yearId;
        request.description = "Close " + account.code + " " + account.name + " to " + retainedCode;
        request.createdBy = CLOSING_USER;
        request.lines.push_back(ports::input::LineRequest::of(account.code, accountSide, amount));
        request.lines.push_back(ports::input::LineRequest::of(retainedCode, domain::opposite(accountSide), amount));
        return request;
    }
};

} // namespace ledger::application
