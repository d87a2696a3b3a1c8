#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Коды ошибок ядра ledger-а
 */
enum class LedgerErrorCode {
    // Валидация
    INVALID_ARGUMENT,
    DUPLICATE_CODE,
    INVALID_PARENT,
    PARTITION_ERROR,
    UNKNOWN_ACCOUNT,
    UNKNOWN_JOURNAL,
    ACCOUNT_NOT_POSTABLE,
    BOTH_SIDES_NONZERO,
    ZERO_AMOUNT,
    INVALID_AMOUNT,
    UNBALANCED,
    NEGATIVE_BALANCE,

    // Не найдено
    NOT_FOUND,

    // Ошибки состояния
    INVALID_STATE,
    HAS_ACTIVE_CHILDREN,
    OUT_OF_ORDER,
    HAS_DRAFT_ENTRIES,
    PERIOD_CLOSED,
    OPEN_PERIODS,

    // Конкурентный доступ (можно повторить)
    CONCURRENCY_CONFLICT,

    // Нарушена целостность хранилища
    LEDGER_INCONSISTENT
};

enum class ErrorCategory {
    VALIDATION,
    NOT_FOUND,
    STATE,
    CONCURRENCY,
    INTEGRITY
};

inline std::string toString(LedgerErrorCode code) {
    switch (code) {
        case LedgerErrorCode::INVALID_ARGUMENT:     return "INVALID_ARGUMENT";
        case LedgerErrorCode::DUPLICATE_CODE:       return "DUPLICATE_CODE";
        case LedgerErrorCode::INVALID_PARENT:       return "INVALID_PARENT";
        case LedgerErrorCode::PARTITION_ERROR:      return "PARTITION_ERROR";
        case LedgerErrorCode::UNKNOWN_ACCOUNT:      return "UNKNOWN_ACCOUNT";
        case LedgerErrorCode::UNKNOWN_JOURNAL:      return "UNKNOWN_JOURNAL";
        case LedgerErrorCode::ACCOUNT_NOT_POSTABLE: return "ACCOUNT_NOT_POSTABLE";
        case LedgerErrorCode::BOTH_SIDES_NONZERO:   return "BOTH_SIDES_NONZERO";
        case LedgerErrorCode::ZERO_AMOUNT:          return "ZERO_AMOUNT";
        case LedgerErrorCode::INVALID_AMOUNT:       return "INVALID_AMOUNT";
        case LedgerErrorCode::UNBALANCED:           return "UNBALANCED";
        case LedgerErrorCode::NEGATIVE_BALANCE:     return "NEGATIVE_BALANCE";
        case LedgerErrorCode::NOT_FOUND:            return "NOT_FOUND";
        case LedgerErrorCode::INVALID_STATE:        return "INVALID_STATE";
        case LedgerErrorCode::HAS_ACTIVE_CHILDREN:  return "HAS_ACTIVE_CHILDREN";
        case LedgerErrorCode::OUT_OF_ORDER:         return "OUT_OF_ORDER";
        case LedgerErrorCode::HAS_DRAFT_ENTRIES:    return "HAS_DRAFT_ENTRIES";
        case LedgerErrorCode::PERIOD_CLOSED:        return "PERIOD_CLOSED";
        case LedgerErrorCode::OPEN_PERIODS:         return "OPEN_PERIODS";
        case LedgerErrorCode::CONCURRENCY_CONFLICT: return "CONCURRENCY_CONFLICT";
        case LedgerErrorCode::LEDGER_INCONSISTENT:  return "LEDGER_INCONSISTENT";
        default: return "UNKNOWN";
    }
}

inline ErrorCategory categoryOf(LedgerErrorCode code) {
    switch (code) {
        case LedgerErrorCode::NOT_FOUND:
            return ErrorCategory::NOT_FOUND;
        case LedgerErrorCode::INVALID_STATE:
        case LedgerErrorCode::HAS_ACTIVE_CHILDREN:
        case LedgerErrorCode::OUT_OF_ORDER:
        case LedgerErrorCode::HAS_DRAFT_ENTRIES:
        case LedgerErrorCode::PERIOD_CLOSED:
        case LedgerErrorCode::OPEN_PERIODS:
            return ErrorCategory::STATE;
        case LedgerErrorCode::CONCURRENCY_CONFLICT:
            return ErrorCategory::CONCURRENCY;
        case LedgerErrorCode::LEDGER_INCONSISTENT:
            return ErrorCategory::INTEGRITY;
        default:
            return ErrorCategory::VALIDATION;
    }
}

/**
 * @brief Исключение ядра ledger-а
 *
 * Все отказы операций ядра сообщаются синхронно этим исключением.
 * Категория определяет реакцию вызывающего:
 * - VALIDATION: исправить входные данные
 * - STATE: выбрать другое действие (например, сторно вместо правки)
 * - CONCURRENCY: можно повторить
 * - INTEGRITY: хранилище испорчено, нужен разбор
 */
class LedgerException : public std::runtime_error {
public:
    LedgerException(LedgerErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    LedgerErrorCode code() const noexcept { return code_; }
    ErrorCategory category() const noexcept { return categoryOf(code_); }
    bool isRetryable() const noexcept { return category() == ErrorCategory::CONCURRENCY; }

private:
    LedgerErrorCode code_;
};

} // namespace ledger::domain
