#pragma once

#include "enums/AccountType.hpp"
#include "enums/EntrySide.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>

namespace ledger::domain {

/**
 * @brief Счёт плана счетов
 *
 * Идентичность: код ("411", "701"). Иерархия задаётся parentCode,
 * дерево хранится плоско (ключ: код) и обходится явно.
 *
 * type неизменен после создания. Изменяемы только name, description,
 * isActive и allowNegative. Счёт никогда не удаляется физически.
 */
struct Account {
    std::string code;                       ///< Уникальный код ("411")
    std::string name;                       ///< Название ("Clients")
    std::string description;
    AccountType type = AccountType::ASSET;
    std::optional<std::string> parentCode;  ///< Родитель в дереве
    bool isActive = true;
    bool allowNegative = true;              ///< Разрешено ли сальдо ниже нуля
    bool allowPosting = true;               ///< false: сводный счёт, только агрегирует детей
    bool isAnalytic = false;                ///< Аналитический счёт (центр затрат)
    Money openingBalance;                   ///< Входящее сальдо на нормальной стороне
    Timestamp createdAt;
    Timestamp updatedAt;

    Account() = default;

    Account(const std::string& code,
            const std::string& name,
            AccountType type,
            std::optional<std::string> parentCode = std::nullopt)
        : code(code)
        , name(name)
        , type(type)
        , parentCode(std::move(parentCode))
    {}

    EntrySide normalSide() const { return normalSideOf(type); }

    bool isRoot() const { return !parentCode.has_value(); }

    /// Знак вклада проводки стороны side в сальдо этого счёта
    int64_t signFor(EntrySide side) const { return side == normalSide() ? 1 : -1; }
};

} // namespace ledger::domain
