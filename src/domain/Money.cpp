#include "domain/Money.hpp"
#include "domain/errors/LedgerError.hpp"
#include <cctype>

namespace ledger::domain {

Money::Money(int64_t value) : value_(value) {
    if (value > kMaxAbsValue || value < -kMaxAbsValue) {
        throw ValidationError("amount",
            "Amount " + std::to_string(value) + " exceeds " +
            std::to_string(kMaxDigits) + " digits");
    }
}

Money Money::parse(const std::string& text) {
    if (text.empty()) {
        throw ValidationError("amount", "Amount cannot be empty");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '+' || text[0] == '-') {
        negative = text[0] == '-';
        pos = 1;
    }

    const size_t digits = text.size() - pos;
    if (digits == 0 || digits > static_cast<size_t>(kMaxDigits)) {
        throw ValidationError("amount", "Amount must be a whole number of at most 18 digits: " + text);
    }

    int64_t value = 0;
    for (size_t i = pos; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) {
            throw ValidationError("amount", "Amount must be a valid number: " + text);
        }
        // 18 цифр гарантированно помещаются в int64_t
        value = value * 10 + (c - '0');
    }

    return Money(negative ? -value : value);
}

Money Money::operator+(const Money& other) const {
    // |a|,|b| < 10^18, поэтому сумма не переполняет int64_t
    return Money(value_ + other.value_);
}

Money Money::operator-(const Money& other) const {
    return Money(value_ - other.value_);
}

} // namespace ledger::domain
