#pragma once

#include "domain/Account.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Хранилище плана счетов (плоская таблица, ключ: код счёта)
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /// Вставка или обновление по коду
    virtual domain::Account save(const domain::Account& account) = 0;
    virtual std::optional<domain::Account> findByCode(const std::string& code) = 0;
    virtual std::vector<domain::Account> findAll() = 0;
    virtual std::vector<domain::Account> findByParent(const std::string& parentCode) = 0;
};

} // namespace ledger::ports::output
