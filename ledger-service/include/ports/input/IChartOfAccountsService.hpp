#pragma once

#include "domain/Account.hpp"
#include "domain/enums/AccountType.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Запрос на создание счёта
 */
struct CreateAccountRequest {
    std::string code;
    std::string name;
    domain::AccountType type = domain::AccountType::ASSET;
    std::optional<std::string> parentCode;
    std::string description;
    bool allowNegative = true;
    bool allowPosting = true;
    bool isAnalytic = false;
    domain::Money openingBalance;
};

/**
 * @brief Изменяемые поля счёта (тип и родитель не меняются)
 */
struct UpdateAccountRequest {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<bool> allowNegative;
};

struct AccountFilter {
    std::optional<domain::AccountType> type;
    std::optional<std::string> parentCode;
    std::optional<bool> active;
};

/**
 * @brief План счетов
 */
class IChartOfAccountsService {
public:
    virtual ~IChartOfAccountsService() = default;

    /**
     * @throws domain::LedgerException DUPLICATE_CODE, INVALID_PARENT, INVALID_ARGUMENT
     */
    virtual domain::Account createAccount(const CreateAccountRequest& request) = 0;

    /**
     * @throws domain::LedgerException NOT_FOUND
     */
    virtual domain::Account getAccount(const std::string& code) = 0;

    virtual std::vector<domain::Account> listAccounts(const AccountFilter& filter) = 0;

    virtual std::vector<domain::Account> listChildren(const std::string& code) = 0;

    /// Предки от корня к непосредственному родителю
    virtual std::vector<domain::Account> ancestorsOf(const std::string& code) = 0;

    /// Все потомки на любой глубине, без самого счёта
    virtual std::vector<domain::Account> descendantsOf(const std::string& code) = 0;

    virtual domain::Account updateAccount(const std::string& code, const UpdateAccountRequest& request) = 0;

    /**
     * @throws domain::LedgerException HAS_ACTIVE_CHILDREN
     */
    virtual domain::Account deactivate(const std::string& code) = 0;

    /**
     * @throws domain::LedgerException INVALID_PARENT если родитель неактивен
     */
    virtual domain::Account reactivate(const std::string& code) = 0;

    /// Минимальный план счетов; существующие коды пропускаются
    virtual int seedDefaultChart() = 0;
};

} // namespace ledger::ports::input
