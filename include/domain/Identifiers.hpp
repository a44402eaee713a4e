// include/domain/Identifiers.hpp
#pragma once

#include "domain/errors/LedgerError.hpp"
#include "utils/UuidGenerator.hpp"
#include <cctype>
#include <functional>
#include <ostream>
#include <string>

namespace ledger::domain {

/**
 * @brief Непрозрачный 128-битный идентификатор (UUID)
 *
 * Tag различает WalletId и TransactionId на уровне типов,
 * чтобы их нельзя было перепутать в сигнатурах.
 */
template <typename Tag>
class Identifier {
public:
    Identifier() = default;

    static Identifier generate() {
        return Identifier(utils::UuidGenerator::generate());
    }

    /**
     * @brief Разобрать UUID в каноническом виде 8-4-4-4-12
     * @throws ValidationError если формат неверный
     */
    static Identifier parse(const std::string& text) {
        if (text.size() != 36) {
            throw ValidationError(Tag::kField, std::string("Invalid ") + Tag::kField + " format: " + text);
        }

        std::string normalized;
        normalized.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            bool dash = (i == 8 || i == 13 || i == 18 || i == 23);
            if (dash ? c != '-' : !std::isxdigit(c)) {
                throw ValidationError(Tag::kField, std::string("Invalid ") + Tag::kField + " format: " + text);
            }
            normalized.push_back(static_cast<char>(std::tolower(c)));
        }
        return Identifier(std::move(normalized));
    }

    const std::string& value() const { return value_; }
    bool empty() const { return value_.empty(); }

    bool operator==(const Identifier& other) const { return value_ == other.value_; }
    bool operator!=(const Identifier& other) const { return value_ != other.value_; }
    bool operator<(const Identifier& other) const { return value_ < other.value_; }

private:
    explicit Identifier(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

struct WalletIdTag {
    static constexpr const char* kField = "wallet_id";
};

struct TransactionIdTag {
    static constexpr const char* kField = "transaction_id";
};

using WalletId = Identifier<WalletIdTag>;
using TransactionId = Identifier<TransactionIdTag>;

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const Identifier<Tag>& id) {
    return os << id.value();
}

/**
 * @brief Внешний идентификатор транзакции
 *
 * Генерируется системой, уникален глобально, регистр значим.
 */
class TxId {
public:
    static constexpr size_t kMaxLength = 255;

    TxId() = default;

    /**
     * @throws ValidationError если строка пустая или длиннее 255 символов
     */
    explicit TxId(std::string value) : value_(std::move(value)) {
        if (value_.empty()) {
            throw ValidationError("txid", "Transaction ID cannot be empty");
        }
        if (value_.size() > kMaxLength) {
            throw ValidationError("txid", "Transaction ID cannot exceed 255 characters");
        }
    }

    const std::string& value() const { return value_; }

    bool operator==(const TxId& other) const { return value_ == other.value_; }
    bool operator!=(const TxId& other) const { return value_ != other.value_; }
    bool operator<(const TxId& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

inline std::ostream& operator<<(std::ostream& os, const TxId& txid) {
    return os << txid.value();
}

} // namespace ledger::domain

namespace std {

template <typename Tag>
struct hash<ledger::domain::Identifier<Tag>> {
    size_t operator()(const ledger::domain::Identifier<Tag>& id) const noexcept {
        return hash<string>{}(id.value());
    }
};

template <>
struct hash<ledger::domain::TxId> {
    size_t operator()(const ledger::domain::TxId& txid) const noexcept {
        return hash<string>{}(txid.value());
    }
};

} // namespace std
