// include/utils/UuidGenerator.hpp
#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ledger::utils {

/**
 * @brief Генератор UUID v4 и случайных hex-строк
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief Генерирует UUID v4
     *
     * Формат: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     * где x - hex digit, y - один из [8, 9, a, b]
     */
    static std::string generate() {
        uint64_t part1 = next();
        uint64_t part2 = next();

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');

        ss << std::setw(8) << ((part1 >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((part1 >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((part1 & 0x0FFF) | 0x4000) << "-";          // version 4
        ss << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000) << "-";  // variant
        ss << std::setw(12) << (part2 & 0xFFFFFFFFFFFF);

        return ss.str();
    }

    /**
     * @brief 128 случайных бит в виде 32 hex-символов без дефисов
     */
    static std::string generateHex128() {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0')
           << std::setw(16) << next()
           << std::setw(16) << next();
        return ss.str();
    }

    /**
     * @brief Случайное число из [from, to]
     */
    static int randomInt(int from, int to) {
        std::uniform_int_distribution<int> dist(from, to);
        return dist(engine());
    }

private:
    static std::mt19937_64& engine() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        return gen;
    }

    static uint64_t next() {
        std::uniform_int_distribution<uint64_t> dist;
        return dist(engine());
    }
};

} // namespace ledger::utils
