// include/domain/Transaction.hpp
#pragma once

#include "Identifiers.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <ostream>

namespace ledger::domain {

/**
 * @brief Транзакция кошелька
 *
 * Неизменяема после создания, кроме одного необратимого перехода
 * active -> deactivated. Знак суммы задаёт направление:
 * > 0 пополнение (credit), < 0 списание (debit), ноль запрещён.
 *
 * Баланс кошелька сущность не трогает: это делает хранилище
 * внутри атомарного протокола.
 */
class Transaction {
public:
    /**
     * @brief Новая активная транзакция
     * @throws ValidationError если amount == 0
     */
    static Transaction create(
        const TransactionId& id,
        const WalletId& walletId,
        const TxId& txid,
        const Money& amount);

    /**
     * @brief Восстановить транзакцию из хранилища
     * @throws ValidationError если состояние противоречиво
     */
    static Transaction restore(
        const TransactionId& id,
        const WalletId& walletId,
        const TxId& txid,
        const Money& amount,
        bool isActive,
        std::optional<Timestamp> deactivatedAt,
        const Timestamp& createdAt,
        const Timestamp& updatedAt);

    const TransactionId& id() const { return id_; }
    const WalletId& walletId() const { return walletId_; }
    const TxId& txid() const { return txid_; }
    const Money& amount() const { return amount_; }
    bool isActive() const { return isActive_; }
    const std::optional<Timestamp>& deactivatedAt() const { return deactivatedAt_; }
    const Timestamp& createdAt() const { return createdAt_; }
    const Timestamp& updatedAt() const { return updatedAt_; }

    /**
     * @brief Деактивировать транзакцию
     * @throws AlreadyDeactivatedError если уже неактивна
     */
    void deactivate();

    bool isCredit() const { return amount_.isPositive(); }
    bool isDebit() const { return amount_.isNegative(); }

    /// Равенство по идентичности (id), остальные поля не сравниваются
    bool operator==(const Transaction& other) const { return id_ == other.id_; }
    bool operator!=(const Transaction& other) const { return !(*this == other); }

private:
    Transaction(
        const TransactionId& id,
        const WalletId& walletId,
        const TxId& txid,
        const Money& amount,
        bool isActive,
        std::optional<Timestamp> deactivatedAt,
        const Timestamp& createdAt,
        const Timestamp& updatedAt);

    TransactionId id_;
    WalletId walletId_;
    TxId txid_;
    Money amount_;
    bool isActive_;
    std::optional<Timestamp> deactivatedAt_;
    Timestamp createdAt_;
    Timestamp updatedAt_;
};

std::ostream& operator<<(std::ostream& os, const Transaction& tx);

} // namespace ledger::domain
