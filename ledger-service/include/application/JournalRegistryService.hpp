#pragma once

#include "ports/input/IJournalRegistryService.hpp"
#include "ports/output/IJournalRepository.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "domain/LedgerException.hpp"
#include <memory>
#include <iostream>
#include <algorithm>
#include <mutex>

namespace ledger::application {

/**
 * @brief Справочник журналов
 *
 * Журнал по умолчанию ровно один, как только он назначен: пометка
 * другого журнала снимает её с прежнего, снять её просто так нельзя.
 */
class JournalRegistryService : public ports::input::IJournalRegistryService {
public:
    static constexpr size_t MAX_CODE_LENGTH = 10;
    static constexpr size_t MAX_NAME_LENGTH = 100;

    JournalRegistryService(
        std::shared_ptr<ports::output::IJournalRepository> journalRepo,
        std::shared_ptr<ports::output::IAccountRepository> accountRepo
    ) : journalRepo_(std::move(journalRepo))
      , accountRepo_(std::move(accountRepo))
    {
        std::cout << "[JournalRegistryService] Created" << std::endl;
    }

    domain::Journal createJournal(const ports::input::CreateJournalRequest& request) override {
        validateIdentity(request.code, request.name);
        if (request.defaultDebitAccount) requireDefaultAccount(*request.defaultDebitAccount);
        if (request.defaultCreditAccount) requireDefaultAccount(*request.defaultCreditAccount);

        std::lock_guard<std::mutex> lock(writeMutex_);

        if (journalRepo_->findByCode(request.code)) {
            throw domain::LedgerException(domain::LedgerErrorCode::DUPLICATE_CODE,
                "Journal code already exists: " + request.code);
        }

        domain::Journal journal(request.code, request.name, request.type);
        journal.description = request.description;
        journal.defaultDebitAccount = request.defaultDebitAccount;
        journal.defaultCreditAccount = request.defaultCreditAccount;

        if (request.isDefault) {
            clearCurrentDefault();
            journal.isDefault = true;
        }

        std::cout << "[JournalRegistryService] Creating journal " << journal.code
                  << " type=" << domain::toString(journal.type)
                  << (journal.isDefault ? " (default)" : "") << std::endl;

        return journalRepo_->save(journal);
    }

    domain::Journal getJournal(const std::string& code) override {
        auto journal = journalRepo_->findByCode(code);
        if (!journal) {
            throw domain::LedgerException(domain::LedgerErrorCode::NOT_FOUND,
                "Journal not found: " + code);
        }
        return *journal;
    }

    std::vector<domain::Journal> listJournals(const ports::input::JournalFilter& filter) override {
        std::vector<domain::Journal> result;
        for (auto& journal : journalRepo_->findAll()) {
            if (filter.type && journal.type != *filter.type) continue;
            if (filter.active && journal.isActive != *filter.active) continue;
            result.push_back(std::move(journal));
        }
        std::sort(result.begin(), result.end(),
                  [](const domain::Journal& a, const domain::Journal& b) { return a.code < b.code; });
        return result;
    }

    domain::Journal updateJournal(const std::string& code,
                                  const ports::input::UpdateJournalRequest& request) override {
        std::lock_guard<std::mutex> lock(writeMutex_);
        auto journal = getJournal(code);

        if (request.name) {
            validateIdentity(journal.code, *request.name);
            journal.name = *request.name;
        }
        if (request.description) {
            journal.description = *request.description;
        }
        if (request.defaultDebitAccount) {
            journal.defaultDebitAccount = optionalAccount(*request.defaultDebitAccount);
        }
        if (request.defaultCreditAccount) {
            journal.defaultCreditAccount = optionalAccount(*request.defaultCreditAccount);
        }

        if (request.isDefault && *request.isDefault != journal.isDefault) {
            if (!*request.isDefault) {
                throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                    "Journal " + code + " is the default; mark another journal as default instead");
            }
            if (!journal.isActive) {
                throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                    "Inactive journal " + code + " cannot become the default");
            }
            clearCurrentDefault();
            journal.isDefault = true;
        }

        journal.updatedAt = domain::Timestamp::now();
        std::cout << "[JournalRegistryService] Updated journal " << code << std::endl;
        return journalRepo_->save(journal);
    }

    domain::Journal deactivate(const std::string& code) override {
        std::lock_guard<std::mutex> lock(writeMutex_);
        auto journal = getJournal(code);

        if (journal.isDefault) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Default journal " + code + " cannot be deactivated");
        }

        journal.isActive = false;
        journal.updatedAt = domain::Timestamp::now();
        std::cout << "[JournalRegistryService] Deactivated journal " << code << std::endl;
        return journalRepo_->save(journal);
    }

    domain::Journal reactivate(const std::string& code) override {
        std::lock_guard<std::mutex> lock(writeMutex_);
        auto journal = getJournal(code);

        journal.isActive = true;
        journal.updatedAt = domain::Timestamp::now();
        std::cout << "[JournalRegistryService] Reactivated journal " << code << std::endl;
        return journalRepo_->save(journal);
    }

    domain::Journal resolveForPosting(const std::optional<std::string>& code) override {
        if (!code || code->empty()) {
            for (auto& journal : journalRepo_->findAll()) {
                if (journal.isDefault && journal.isActive) return journal;
            }
            throw domain::LedgerException(domain::LedgerErrorCode::UNKNOWN_JOURNAL,
                "No default journal configured");
        }

        auto journal = journalRepo_->findByCode(*code);
        if (!journal || !journal->isActive) {
            throw domain::LedgerException(domain::LedgerErrorCode::UNKNOWN_JOURNAL,
                journal ? "Journal is inactive: " + *code : "Unknown journal: " + *code);
        }
        return *journal;
    }

    int seedDefaultJournals() override {
        struct Seed {
            const char* code;
            const char* name;
            domain::JournalType type;
            const char* debitAccount;
            const char* creditAccount;
        };

        const Seed seeds[] = {
            {"AC", "Achats", domain::JournalType::PURCHASE, "601", "401"},
            {"VT", "Ventes", domain::JournalType::SALES, "411", "701"},
            {"BQ", "Banque", domain::JournalType::TREASURY, nullptr, nullptr},
            {"OD", "Operations diverses", domain::JournalType::MISCELLANEOUS, nullptr, nullptr},
        };

        bool hasDefault = false;
        for (const auto& journal : journalRepo_->findAll()) {
            hasDefault = hasDefault || journal.isDefault;
        }

        int created = 0;
        for (const auto& seed : seeds) {
            if (journalRepo_->findByCode(seed.code)) continue;

            ports::input::CreateJournalRequest request;
            request.code = seed.code;
            request.name = seed.name;
            request.type = seed.type;
            // Без плана счетов журнал создаётся без счетов по умолчанию
            if (seed.debitAccount && accountRepo_->findByCode(seed.debitAccount)) {
                request.defaultDebitAccount = seed.debitAccount;
            }
            if (seed.creditAccount && accountRepo_->findByCode(seed.creditAccount)) {
                request.defaultCreditAccount = seed.creditAccount;
            }
            request.isDefault = !hasDefault && seed.type == domain::JournalType::MISCELLANEOUS;
            createJournal(request);
            ++created;
        }

        std::cout << "[JournalRegistryService] Seeded " << created << " journals" << std::endl;
        return created;
    }

private:
    std::shared_ptr<ports::output::IJournalRepository> journalRepo_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::mutex writeMutex_;

    void validateIdentity(const std::string& code, const std::string& name) const {
        if (code.empty() || code.size() > MAX_CODE_LENGTH) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_ARGUMENT,
                "Journal code must be 1.." + std::to_string(MAX_CODE_LENGTH) + " characters");
        }
        if (name.empty() || name.size() > MAX_NAME_LENGTH) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_ARGUMENT,
                "Journal name must be 1.." + std::to_string(MAX_NAME_LENGTH) + " characters");
        }
    }

    void requireDefaultAccount(const std::string& code) {
        auto account = accountRepo_->findByCode(code);
        if (!account || !account->isActive) {
            throw domain::LedgerException(domain::LedgerErrorCode::UNKNOWN_ACCOUNT,
                account ? "Account is inactive: " + code : "Unknown account: " + code);
        }
        if (!account->allowPosting || account->isAnalytic) {
            throw domain::LedgerException(domain::LedgerErrorCode::ACCOUNT_NOT_POSTABLE,
                "Account " + code + " does not accept postings");
        }
    }

    std::optional<std::string> optionalAccount(const std::string& code) {
        if (code.empty()) return std::nullopt;
        requireDefaultAccount(code);
        return code;
    }

    // Вызывается под writeMutex_
    void clearCurrentDefault() {
        for (auto journal : journalRepo_->findAll()) {
            if (!journal.isDefault) continue;
            journal.isDefault = false;
            journal.updatedAt = domain::Timestamp::now();
            journalRepo_->save(journal);
            std::cout << "[JournalRegistryService] Journal " << journal.code << " is no longer default" << std::endl;
        }
    }
};

} // namespace ledger::application
