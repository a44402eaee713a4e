// include/domain/Wallet.hpp
#pragma once

#include "Identifiers.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include "Transaction.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Кошелёк: метка, баланс, состояние активности
 *
 * ВАЖНО: сущность НЕ является источником истины для баланса.
 *
 * Баланс в памяти - это снимок, прочитанный из хранилища. Новый баланс
 * считает только ILedgerStore внутри атомарного протокола под блокировкой
 * строки кошелька. addTransaction() намеренно не пересчитывает balance():
 * два вызывающих с разными копиями одного кошелька прочитали бы один и тот же
 * баланс и оба записали бы результат (гонка read-then-write).
 *
 * transactions() - транзакции, накопленные в рамках текущего use case,
 * а не полный список транзакций кошелька в хранилище.
 */
class Wallet {
public:
    static constexpr size_t kMaxLabelLength = 255;

    /**
     * @brief Новый активный кошелёк с нулевым балансом
     * @throws ValidationError если метка пустая или длиннее 255 символов
     */
    static Wallet create(const WalletId& id, const std::string& label);

    /**
     * @brief Восстановить кошелёк из хранилища
     * @throws ValidationError если состояние противоречиво
     */
    static Wallet restore(
        const WalletId& id,
        const std::string& label,
        const Money& balance,
        bool isActive,
        std::optional<Timestamp> deactivatedAt,
        const Timestamp& createdAt,
        const Timestamp& updatedAt,
        std::vector<Transaction> transactions = {});

    /**
     * @brief Обрезать пробелы и проверить метку
     * @throws ValidationError если метка пустая после trim или длиннее 255 символов
     */
    static std::string normalizeLabel(const std::string& label);

    const WalletId& id() const { return id_; }
    const std::string& label() const { return label_; }
    const Money& balance() const { return balance_; }
    bool isActive() const { return isActive_; }
    const std::optional<Timestamp>& deactivatedAt() const { return deactivatedAt_; }
    const Timestamp& createdAt() const { return createdAt_; }
    const Timestamp& updatedAt() const { return updatedAt_; }
    const std::vector<Transaction>& transactions() const { return transactions_; }

    /**
     * @throws AlreadyDeactivatedError если кошелёк неактивен
     * @throws ValidationError если метка пустая после trim
     */
    void updateLabel(const std::string& newLabel);

    /**
     * @brief Добавить транзакцию в список use case
     *
     * Баланс не пересчитывается (см. описание класса).
     *
     * @throws AlreadyDeactivatedError если кошелёк неактивен
     * @throws ValidationError если транзакция принадлежит другому кошельку
     */
    void addTransaction(const Transaction& transaction);

    /**
     * @brief Деактивировать кошелёк и все загруженные в память транзакции
     *
     * Деактивация транзакций, не загруженных в этот экземпляр,
     * выполняется хранилищем (ILedgerStore::deactivateWalletWithTransactions).
     *
     * @throws AlreadyDeactivatedError если кошелёк уже неактивен
     */
    void deactivate();

    std::vector<Transaction> getActiveTransactions() const;

    /**
     * @brief Сумма активных транзакций в памяти
     *
     * Только для проверок и тестов, не для записи в хранилище.
     */
    Money calculateBalanceFromTransactions() const;

    bool operator==(const Wallet& other) const { return id_ == other.id_; }
    bool operator!=(const Wallet& other) const { return !(*this == other); }

private:
    Wallet(
        const WalletId& id,
        const std::string& label,
        const Money& balance,
        bool isActive,
        std::optional<Timestamp> deactivatedAt,
        const Timestamp& createdAt,
        const Timestamp& updatedAt,
        std::vector<Transaction> transactions);

    void touch();

    WalletId id_;
    std::string label_;
    Money balance_;
    bool isActive_;
    std::optional<Timestamp> deactivatedAt_;
    Timestamp createdAt_;
    Timestamp updatedAt_;
    std::vector<Transaction> transactions_;
};

std::ostream& operator<<(std::ostream& os, const Wallet& wallet);

} // namespace ledger::domain
