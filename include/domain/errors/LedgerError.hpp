// include/domain/errors/LedgerError.hpp
#pragma once

#include "domain/Money.hpp"
#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Вид доменной ошибки
 *
 * Закрытый набор: вызывающий код переключается по kind(),
 * а не разбирает текст сообщения.
 */
enum class ErrorKind {
    NOT_FOUND,
    VALIDATION,
    ALREADY_DEACTIVATED,
    INSUFFICIENT_BALANCE,
    LOCK_TIMEOUT,
    CONFLICT
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND:            return "NOT_FOUND";
        case ErrorKind::VALIDATION:           return "VALIDATION";
        case ErrorKind::ALREADY_DEACTIVATED:  return "ALREADY_DEACTIVATED";
        case ErrorKind::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case ErrorKind::LOCK_TIMEOUT:         return "LOCK_TIMEOUT";
        case ErrorKind::CONFLICT:             return "CONFLICT";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Базовое исключение леджера
 */
class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    /**
     * @brief Можно ли повторить весь use case целиком
     *
     * Повтор означает новую загрузку состояния, а не продолжение
     * со старыми данными в памяти.
     */
    bool retryable() const { return kind_ == ErrorKind::LOCK_TIMEOUT; }

private:
    ErrorKind kind_;
};

/**
 * @brief Кошелёк или транзакция не найдены
 *
 * Включает случай "существует, но деактивирован" для поиска только активных.
 */
class NotFoundError : public LedgerError {
public:
    NotFoundError(const std::string& entity, const std::string& id)
        : LedgerError(ErrorKind::NOT_FOUND, entity + " with ID " + id + " not found")
        , entity_(entity), id_(id) {}

    const std::string& entity() const { return entity_; }
    const std::string& id() const { return id_; }

private:
    std::string entity_;
    std::string id_;
};

/**
 * @brief Некорректный ввод, исправляется вызывающей стороной
 */
class ValidationError : public LedgerError {
public:
    ValidationError(const std::string& field, const std::string& message)
        : LedgerError(ErrorKind::VALIDATION, message), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class AlreadyDeactivatedError : public LedgerError {
public:
    AlreadyDeactivatedError(const std::string& entity, const std::string& id)
        : LedgerError(ErrorKind::ALREADY_DEACTIVATED, entity + " " + id + " is already deactivated")
        , entity_(entity), id_(id) {}

    const std::string& entity() const { return entity_; }
    const std::string& id() const { return id_; }

private:
    std::string entity_;
    std::string id_;
};

/**
 * @brief Транзакция увела бы баланс в минус
 *
 * Несёт текущий баланс, сумму транзакции и результат для диагностики.
 */
class InsufficientBalanceError : public LedgerError {
public:
    InsufficientBalanceError(const Money& current, const Money& delta, const Money& resulting)
        : LedgerError(ErrorKind::INSUFFICIENT_BALANCE,
              "Transaction would result in negative balance. Current: " + current.toString() +
              ", Transaction: " + delta.toString() +
              ", New Balance: " + resulting.toString())
        , current_(current), delta_(delta), resulting_(resulting) {}

    const Money& current() const { return current_; }
    const Money& delta() const { return delta_; }
    const Money& resulting() const { return resulting_; }

private:
    Money current_;
    Money delta_;
    Money resulting_;
};

/**
 * @brief Блокировку строки не удалось взять за отведённое время
 */
class LockTimeoutError : public LedgerError {
public:
    explicit LockTimeoutError(const std::string& resource)
        : LedgerError(ErrorKind::LOCK_TIMEOUT, "Lock timeout on " + resource + ", retry the operation")
        , resource_(resource) {}

    const std::string& resource() const { return resource_; }

private:
    std::string resource_;
};

/**
 * @brief Нарушение уникальности (txid, id) при вставке
 */
class ConflictError : public LedgerError {
public:
    explicit ConflictError(const std::string& key)
        : LedgerError(ErrorKind::CONFLICT, "Duplicate key: " + key)
        , key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

} // namespace ledger::domain
