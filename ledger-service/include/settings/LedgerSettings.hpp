// include/settings/LedgerSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>
#include <cstdint>

namespace ledger::settings {

/**
 * @brief Неизменяемая конфигурация ядра ledger-а
 *
 * Собирается один раз при старте (fromEnvironment) и передаётся
 * сервисам через конструктор. Ядро не читает ENV само.
 *
 * Переменные окружения:
 * - LEDGER_CURRENCY: код валюты книги (XOF)
 * - LEDGER_CURRENCY_SCALE: знаков после запятой для отображения (0 для XOF)
 * - LEDGER_MIN_LINE_AMOUNT: минимальная сумма строки в минорных единицах
 * - LEDGER_RETAINED_EARNINGS_ACCOUNT: счёт нераспределённой прибыли
 * - LEDGER_MAX_COMMIT_RETRIES: повторы при CONCURRENCY_CONFLICT
 * - LEDGER_STORAGE: postgres | memory
 * - LEDGER_SEED_CHART: создать минимальный план счетов при старте
 */
struct LedgerSettings {
    std::string currency = "XOF";
    int currencyScale = 0;
    int64_t minLineAmount = 1;
    std::string retainedEarningsAccount = "121";
    int maxCommitRetries = 3;
    std::string storage = "postgres";
    bool seedChart = false;

    static LedgerSettings fromEnvironment() {
        LedgerSettings s;
        s.currency = getEnvOrDefault("LEDGER_CURRENCY", s.currency);
        s.currencyScale = std::stoi(getEnvOrDefault("LEDGER_CURRENCY_SCALE", std::to_string(s.currencyScale)));
        s.minLineAmount = std::stoll(getEnvOrDefault("LEDGER_MIN_LINE_AMOUNT", std::to_string(s.minLineAmount)));
        s.retainedEarningsAccount = getEnvOrDefault("LEDGER_RETAINED_EARNINGS_ACCOUNT", s.retainedEarningsAccount);
        s.maxCommitRetries = std::stoi(getEnvOrDefault("LEDGER_MAX_COMMIT_RETRIES", std::to_string(s.maxCommitRetries)));
        s.storage = getEnvOrDefault("LEDGER_STORAGE", s.storage);
        s.seedChart = getEnvOrDefault("LEDGER_SEED_CHART", "false") == "true";

        if (s.minLineAmount < 1) {
            throw std::runtime_error("LEDGER_MIN_LINE_AMOUNT must be >= 1");
        }
        if (s.maxCommitRetries < 0) {
            throw std::runtime_error("LEDGER_MAX_COMMIT_RETRIES must be >= 0");
        }
        if (s.storage != "postgres" && s.storage != "memory") {
            throw std::runtime_error("LEDGER_STORAGE must be 'postgres' or 'memory', got: " + s.storage);
        }
        return s;
    }

private:
    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : defaultValue;
    }
};

} // namespace ledger::settings
