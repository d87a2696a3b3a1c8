#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/Balance.hpp"
#include <string>
#include <map>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Хранилище текущих сальдо счетов
 *
 * Сальдо хранится как накопленное движение на нормальной стороне счёта
 * (без входящего сальдо и без потомков).
 */
class IBalanceRepository {
public:
    virtual ~IBalanceRepository() = default;

    /**
     * @brief Атомарно провести проводку и применить изменения сальдо
     *
     * Либо проводка становится POSTED и все deltas применены,
     * либо не меняется ничего.
     *
     * @throws domain::LedgerException
     *   - INVALID_STATE: проводка уже проведена (повторный post)
     *   - NEGATIVE_BALANCE: счёт с allowNegative == false ушёл бы в минус
     *   - CONCURRENCY_CONFLICT: конфликт блокировок, можно повторить
     */
    virtual void commitPosting(const domain::JournalEntry& posted,
                               const std::vector<domain::BalanceDelta>& deltas) = 0;

    /// Накопленное движение по счёту; 0 если проводок не было
    virtual domain::Money findMovement(const std::string& accountCode) = 0;

    virtual std::map<std::string, domain::Money> findAllMovements() = 0;
};

} // namespace ledger::ports::output
