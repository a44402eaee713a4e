// include/domain/Money.hpp
#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace ledger::domain {

/**
 * @brief Денежная сумма в целых единицах
 *
 * Дробных единиц в кошельках нет: сумма хранится как int64_t,
 * модуль не превышает 18 десятичных разрядов (как NUMERIC(18,0) в БД).
 *
 * Ноль допустим для баланса кошелька, но не для суммы транзакции
 * (это проверяет Transaction).
 *
 * @example
 * ```cpp
 * auto balance = Money(100);
 * auto debit = Money::parse("-60");
 * auto result = balance + debit;   // 40
 * ```
 */
class Money {
public:
    static constexpr int kMaxDigits = 18;
    static constexpr int64_t kMaxAbsValue = 999'999'999'999'999'999LL;

    Money() = default;

    /**
     * @throws ValidationError если значение выходит за 18 разрядов
     */
    explicit Money(int64_t value);

    /**
     * @brief Разобрать сумму из строки ("1000", "-1500", "+7")
     * @throws ValidationError если строка не целое число до 18 разрядов
     */
    static Money parse(const std::string& text);

    static Money zero() { return Money(); }

    int64_t value() const { return value_; }

    bool isZero() const { return value_ == 0; }
    bool isPositive() const { return value_ > 0; }
    bool isNegative() const { return value_ < 0; }

    /// Сложение с проверкой диапазона
    Money operator+(const Money& other) const;
    Money operator-(const Money& other) const;
    Money operator-() const { return Money(-value_); }

    Money& operator+=(const Money& other) {
        *this = *this + other;
        return *this;
    }

    Money& operator-=(const Money& other) {
        *this = *this - other;
        return *this;
    }

    bool operator==(const Money& other) const { return value_ == other.value_; }
    bool operator!=(const Money& other) const { return value_ != other.value_; }
    bool operator<(const Money& other) const { return value_ < other.value_; }
    bool operator>(const Money& other) const { return value_ > other.value_; }
    bool operator<=(const Money& other) const { return value_ <= other.value_; }
    bool operator>=(const Money& other) const { return value_ >= other.value_; }

    std::string toString() const { return std::to_string(value_); }

private:
    int64_t value_ = 0;
};

inline std::ostream& operator<<(std::ostream& os, const Money& money) {
    return os << money.value();
}

} // namespace ledger::domain
