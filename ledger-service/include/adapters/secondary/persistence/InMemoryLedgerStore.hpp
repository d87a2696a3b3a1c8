#pragma once

#include "ports/output/IJournalEntryRepository.hpp"
#include "ports/output/IBalanceRepository.hpp"
#include "domain/LedgerException.hpp"
#include <unordered_map>
#include <map>
#include <shared_mutex>
#include <mutex>
#include <algorithm>
#include <cstdio>

namespace ledger::adapters::secondary {

/**
 * @brief Проводки и сальдо в памяти под одной блокировкой
 *
 * Реализует оба порта одним объектом: commitPosting меняет статус
 * проводки и сальдо под одним unique_lock, читатели не видят
 * промежуточного состояния. В DI оба интерфейса связаны с одним экземпляром.
 */
class InMemoryLedgerStore : public ports::output::IJournalEntryRepository,
                            public ports::output::IBalanceRepository {
public:
    std::string nextEntryId() override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "JE-%06lld", static_cast<long long>(++lastEntryNumber_));
        return buffer;
    }

    domain::JournalEntry saveDraft(const domain::JournalEntry& entry) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        requirePending(entry.entryId);
        if (!domain::isPending(entry.status)) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "saveDraft called with " + domain::toString(entry.status) + " entry " + entry.entryId);
        }
        entries_[entry.entryId] = entry;
        return entry;
    }

    std::optional<domain::JournalEntry> findById(const std::string& entryId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(entryId);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::JournalEntry> find(const domain::EntryFilter& filter) override {
        std::vector<domain::JournalEntry> result;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            for (const auto& [id, entry] : entries_) {
                if (filter.matches(entry)) {
                    result.push_back(entry);
                }
            }
        }
        std::sort(result.begin(), result.end(), [](const domain::JournalEntry& a, const domain::JournalEntry& b) {
            if (a.date != b.date) return a.date < b.date;
            if (a.entryId.size() != b.entryId.size()) return a.entryId.size() < b.entryId.size();
            return a.entryId < b.entryId;
        });
        return result;
    }

    int archive(const domain::Date& from, const domain::Date& to) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        int count = 0;
        for (auto& [id, entry] : entries_) {
            if (entry.status == domain::EntryStatus::POSTED && !(entry.date < from) && !(to < entry.date)) {
                entry.status = domain::EntryStatus::ARCHIVED;
                ++count;
            }
        }
        return count;
    }

    bool archiveEntry(const std::string& entryId) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(entryId);
        if (it == entries_.end() || it->second.status != domain::EntryStatus::POSTED) {
            return false;
        }
        it->second.status = domain::EntryStatus::ARCHIVED;
        return true;
    }

    void commitPosting(const domain::JournalEntry& posted,
                       const std::vector<domain::BalanceDelta>& deltas) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        requirePending(posted.entryId);

        // Новые обороты считаются отдельно: переполнение или минус
        // на любом счёте не должны оставить частично применённую проводку
        std::map<std::string, domain::Money> updated;
        for (const auto& delta : deltas) {
            auto it = updated.find(delta.accountCode);
            auto current = it != updated.end() ? it->second : movementOf(delta.accountCode);
            auto next = current + delta.amount;

            if (!delta.allowNegative) {
                auto after = delta.openingBalance + next;
                if (after.isNegative()) {
                    throw domain::LedgerException(domain::LedgerErrorCode::NEGATIVE_BALANCE,
                        "Posting " + posted.entryId + " would take account " + delta.accountCode +
                        " to " + after.toString());
                }
            }
            updated[delta.accountCode] = next;
        }

        for (const auto& [code, movement] : updated) {
            movements_[code] = movement;
        }
        entries_[posted.entryId] = posted;
    }

    domain::Money findMovement(const std::string& accountCode) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return movementOf(accountCode);
    }

    std::map<std::string, domain::Money> findAllMovements() override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return movements_;
    }

    // Test helpers
    void clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.clear();
        movements_.clear();
        lastEntryNumber_ = 0;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    /// Прямая запись сальдо в обход проводок (для тестов на расхождение)
    void overwriteMovement(const std::string& accountCode, domain::Money amount) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        movements_[accountCode] = amount;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, domain::JournalEntry> entries_;
    std::map<std::string, domain::Money> movements_;
    long long lastEntryNumber_ = 0;

    void requirePending(const std::string& entryId) const {
        auto it = entries_.find(entryId);
        if (it != entries_.end() && !domain::isPending(it->second.status)) {
            throw domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE,
                "Entry " + entryId + " is already " + domain::toString(it->second.status));
        }
    }

    domain::Money movementOf(const std::string& accountCode) const {
        auto it = movements_.find(accountCode);
        return it == movements_.end() ? domain::Money() : it->second;
    }
};

} // namespace ledger::adapters::secondary
