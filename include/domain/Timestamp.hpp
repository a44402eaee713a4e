// include/domain/Timestamp.hpp
#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Временная метка UTC с точностью до микросекунды
 *
 * Точность совпадает с TIMESTAMPTZ в PostgreSQL, поэтому сохранённая
 * и перечитанная сущность совпадает поле в поле.
 */
class Timestamp {
public:
    using Clock = std::chrono::system_clock;
    using Micros = std::chrono::microseconds;

    std::chrono::time_point<Clock, Micros> value;

    Timestamp() : value(std::chrono::time_point_cast<Micros>(Clock::now())) {}

    explicit Timestamp(Clock::time_point tp) : value(std::chrono::time_point_cast<Micros>(tp)) {}

    static Timestamp now() {
        return Timestamp(Clock::now());
    }

    static Timestamp fromMicros(int64_t micros) {
        Timestamp ts;
        ts.value = std::chrono::time_point<Clock, Micros>(Micros(micros));
        return ts;
    }

    int64_t toMicros() const {
        return value.time_since_epoch().count();
    }

    /**
     * @brief Разбор ISO 8601: "2026-10-19T12:00:00Z" или "2026-10-19T12:00:00.123456Z"
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + str);
        }

        int64_t fraction = 0;
        if (ss.peek() == '.') {
            ss.get();
            int digits = 0;
            while (std::isdigit(ss.peek()) && digits < 6) {
                fraction = fraction * 10 + (ss.get() - '0');
                ++digits;
            }
            for (; digits < 6; ++digits) {
                fraction *= 10;
            }
        }

        int64_t seconds = static_cast<int64_t>(timegm(&tm));
        return fromMicros(seconds * 1000000 + fraction);
    }

    std::string toString() const {
        int64_t micros = toMicros();
        int64_t seconds = micros / 1000000;
        int64_t fraction = micros % 1000000;
        if (fraction < 0) {
            fraction += 1000000;
            seconds -= 1;
        }

        std::time_t time_t_val = static_cast<std::time_t>(seconds);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(6) << std::setfill('0') << fraction << 'Z';
        return ss.str();
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace ledger::domain
