// include/settings/DbSettings.hpp
#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ledger::settings {

/**
 * @brief Настройки подключения к PostgreSQL из ENV
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("LEDGER_DB_HOST", "localhost");
        port_ = getPort("LEDGER_DB_PORT", "5432");
        name_ = getEnvOrDefault("LEDGER_DB_NAME", "ledger_db");
        user_ = getEnvOrDefault("LEDGER_DB_USER", "ledger_user");
        password_ = getEnvOrThrow("LEDGER_DB_PASSWORD");
    }

    /**
     * @brief Готовая строка подключения (интеграционные тесты)
     */
    explicit DbSettings(std::string connectionString)
        : port_(0)
        , connectionString_(std::move(connectionString)) {}

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }

    std::string getConnectionString() const {
        if (!connectionString_.empty()) {
            return connectionString_;
        }
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    std::string connectionString_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    /**
     * @throws std::runtime_error с именем переменной, если порт не число из [1, 65535]
     */
    static int getPort(const char* name, const std::string& defaultValue) {
        std::string raw = getEnvOrDefault(name, defaultValue);
        int value = 0;
        size_t pos = 0;
        try {
            value = std::stoi(raw, &pos);
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("Invalid port in ") + name + ": " + raw);
        }
        if (pos != raw.size() || value < 1 || value > 65535) {
            throw std::runtime_error(std::string("Invalid port in ") + name + ": " + raw);
        }
        return value;
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
