#pragma once

#include "ports/output/IAccountRepository.hpp"
#include <unordered_map>
#include <mutex>

namespace ledger::adapters::secondary {

/**
 * @brief План счетов в памяти (LEDGER_STORAGE=memory и unit-тесты)
 */
class InMemoryAccountRepository : public ports::output::IAccountRepository {
public:
    domain::Account save(const domain::Account& account) override {
        std::lock_guard<std::mutex> lock(mutex_);
        accounts_[account.code] = account;
        return account;
    }

    std::optional<domain::Account> findByCode(const std::string& code) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(code);
        if (it == accounts_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::Account> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Account> result;
        result.reserve(accounts_.size());
        for (const auto& [code, account] : accounts_) {
            result.push_back(account);
        }
        return result;
    }

    std::vector<domain::Account> findByParent(const std::string& parentCode) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Account> result;
        for (const auto& [code, account] : accounts_) {
            if (account.parentCode == parentCode) {
                result.push_back(account);
            }
        }
        return result;
    }

    // Test helpers
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        accounts_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accounts_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::Account> accounts_;
};

} // namespace ledger::adapters::secondary
