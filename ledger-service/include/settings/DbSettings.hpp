// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace ledger::settings {

/**
 * @brief Настройки подключения к PostgreSQL из ENV
 *
 * LEDGER_DB_URL (libpq URI или key=value строка) имеет приоритет.
 * Иначе строка собирается из LEDGER_DB_HOST/PORT/NAME/USER/PASSWORD,
 * пароль обязателен.
 */
class DbSettings {
public:
    DbSettings() {
        if (const char* url = std::getenv("LEDGER_DB_URL")) {
            connectionString_ = url;
            return;
        }

        const std::string host = getEnvOrDefault("LEDGER_DB_HOST", "localhost");
        const int port = std::stoi(getEnvOrDefault("LEDGER_DB_PORT", "5432"));
        const std::string name = getEnvOrDefault("LEDGER_DB_NAME", "ledger_db");
        const std::string user = getEnvOrDefault("LEDGER_DB_USER", "ledger_user");
        const std::string password = getEnvOrThrow("LEDGER_DB_PASSWORD");
        const std::string timeout = getEnvOrDefault("LEDGER_DB_CONNECT_TIMEOUT", "5");

        connectionString_ = "host=" + host +
                            " port=" + std::to_string(port) +
                            " dbname=" + name +
                            " user=" + user +
                            " password=" + password +
                            " connect_timeout=" + timeout;
    }

    std::string getConnectionString() const { return connectionString_; }

private:
    std::string connectionString_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static std::string getEnvOrThrow(const char* name) {
        const char* value = std::getenv(name);
        if (!value) {
            throw std::runtime_error(std::string("Required env variable not set: ") + name);
        }
        return value;
    }
};

} // namespace ledger::settings
