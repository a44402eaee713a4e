// include/settings/LedgerSettings.hpp
#pragma once

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ledger::settings {

/**
 * @brief Тип хранилища
 */
enum class StorageBackend {
    POSTGRES,   ///< PostgreSQL (по умолчанию)
    MEMORY      ///< In-memory, для демо и тестов
};

inline std::string toString(StorageBackend backend) {
    switch (backend) {
        case StorageBackend::POSTGRES: return "postgres";
        case StorageBackend::MEMORY:   return "memory";
        default: return "unknown";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline StorageBackend parseStorageBackend(const std::string& str) {
    if (str == "postgres" || str == "POSTGRES") return StorageBackend::POSTGRES;
    if (str == "memory" || str == "MEMORY")     return StorageBackend::MEMORY;
    throw std::invalid_argument("Unknown storage backend: " + str);
}

/**
 * @brief Настройки леджера из ENV
 *
 * - LEDGER_STORAGE: postgres | memory
 * - LEDGER_LOCK_TIMEOUT_MS: ожидание блокировки строки кошелька
 * - LEDGER_TXID_MAX_ATTEMPTS: повторы генератора txid при коллизии
 * - LEDGER_DEFAULT_PAGE_SIZE / LEDGER_MAX_PAGE_SIZE: пагинация
 */
class LedgerSettings {
public:
    LedgerSettings() {
        storage_ = parseStorageBackend(getEnvOrDefault("LEDGER_STORAGE", "postgres"));
        lockTimeoutMs_ = getPositiveInt("LEDGER_LOCK_TIMEOUT_MS", "5000");
        txidMaxAttempts_ = getPositiveInt("LEDGER_TXID_MAX_ATTEMPTS", "10");
        defaultPageSize_ = getPositiveInt("LEDGER_DEFAULT_PAGE_SIZE", "20");
        maxPageSize_ = getPositiveInt("LEDGER_MAX_PAGE_SIZE", "100");

        if (defaultPageSize_ > maxPageSize_) {
            throw std::runtime_error("LEDGER_DEFAULT_PAGE_SIZE exceeds LEDGER_MAX_PAGE_SIZE");
        }
    }

    StorageBackend getStorage() const { return storage_; }
    std::chrono::milliseconds getLockTimeout() const { return std::chrono::milliseconds(lockTimeoutMs_); }
    int getTxidMaxAttempts() const { return txidMaxAttempts_; }
    int getDefaultPageSize() const { return defaultPageSize_; }
    int getMaxPageSize() const { return maxPageSize_; }

private:
    StorageBackend storage_;
    int lockTimeoutMs_;
    int txidMaxAttempts_;
    int defaultPageSize_;
    int maxPageSize_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static int getPositiveInt(const char* name, const std::string& defaultValue) {
        std::string raw = getEnvOrDefault(name, defaultValue);
        int value = 0;
        size_t pos = 0;
        try {
            value = std::stoi(raw, &pos);
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("Invalid integer in ") + name + ": " + raw);
        }
        // "250ms" не число, хотя stoi прочитал бы 250
        if (pos != raw.size()) {
            throw std::runtime_error(std::string("Invalid integer in ") + name + ": " + raw);
        }
        if (value <= 0) {
            throw std::runtime_error(std::string(name) + " must be positive, got " + raw);
        }
        return value;
    }
};

} // namespace ledger::settings
