#pragma once

#include "ports/output/IJournalRepository.hpp"
#include <unordered_map>
#include <mutex>

namespace ledger::adapters::secondary {

/**
 * @brief Журналы в памяти
 */
class InMemoryJournalRepository : public ports::output::IJournalRepository {
public:
    domain::Journal save(const domain::Journal& journal) override {
        std::lock_guard<std::mutex> lock(mutex_);
        journals_[journal.code] = journal;
        return journal;
    }

    std::optional<domain::Journal> findByCode(const std::string& code) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = journals_.find(code);
        if (it == journals_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::Journal> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Journal> result;
        result.reserve(journals_.size());
        for (const auto& [code, journal] : journals_) {
            result.push_back(journal);
        }
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return journals_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::Journal> journals_;
};

} // namespace ledger::adapters::secondary
