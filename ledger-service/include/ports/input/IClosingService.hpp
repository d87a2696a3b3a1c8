#pragma once

#include "domain/Money.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::input {

struct ClosingResult {
    std::string fiscalYearId;
    std::string retainedEarningsAccount;
    std::vector<std::string> closingEntryIds;
    domain::Money netIncome;        ///< > 0: прибыль, < 0: убыток
    int archivedEntries = 0;
};

/**
 * @brief Закрытие финансового года
 */
class IClosingService {
public:
    virtual ~IClosingService() = default;

    /**
     * @throws domain::LedgerException NOT_FOUND, INVALID_STATE, OPEN_PERIODS, INVALID_ARGUMENT
     */
    virtual ClosingResult closeFiscalYear(const std::string& yearId,
                                          const std::optional<std::string>& retainedEarningsAccount) = 0;
};

} // namespace ledger::ports::input
