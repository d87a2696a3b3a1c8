#pragma once

#include "domain/Journal.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Хранилище журналов (ключ: код журнала)
 */
class IJournalRepository {
public:
    virtual ~IJournalRepository() = default;

    /// Вставка или обновление по коду
    virtual domain::Journal save(const domain::Journal& journal) = 0;
    virtual std::optional<domain::Journal> findByCode(const std::string& code) = 0;
    virtual std::vector<domain::Journal> findAll() = 0;
};

} // namespace ledger::ports::output
