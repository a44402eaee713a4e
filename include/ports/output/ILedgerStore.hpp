// include/ports/output/ILedgerStore.hpp
#pragma once

#include "domain/Identifiers.hpp"
#include "domain/Page.hpp"
#include "domain/Transaction.hpp"
#include "domain/TransactionResult.hpp"
#include "domain/Wallet.hpp"
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Хранилище кошельков и транзакций
 *
 * Единственный писатель баланса и состояния активности. Два метода
 * выполняются атомарно под эксклюзивной блокировкой строки кошелька:
 *
 * - createTransactionWithBalanceUpdate (протокол A): блокировка кошелька,
 *   перечитывание баланса, проверка >= 0, вставка транзакции и новый баланс
 *   одним коммитом.
 * - deactivateWalletWithTransactions (протокол B): блокировка кошелька и всех
 *   его активных транзакций, деактивация каскадом, баланс уменьшается на сумму
 *   деактивированных транзакций, один коммит.
 *
 * Все остальные методы - обычные чтения и запись метки.
 *
 * Хранилище само ничего не повторяет: LockTimeoutError уходит вызывающему.
 *
 * @example
 * ```cpp
 * auto wallet = store->findActiveWalletById(walletId);
 * auto tx = domain::Transaction::create(...);
 * auto result = store->createTransactionWithBalanceUpdate(*wallet, tx);
 * // result.wallet.balance() - баланс после коммита
 * ```
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    // =========================================================================
    // Кошельки
    // =========================================================================

    /**
     * @brief Вставить новый кошелёк
     * @throws ConflictError если id уже занят
     */
    virtual domain::Wallet insertWallet(const domain::Wallet& wallet) = 0;

    /**
     * @brief Записать метку и updated_at, остальные поля не трогаются
     *
     * Ждёт блокировку строки кошелька, как протоколы A и B.
     *
     * @throws NotFoundError если кошелька нет
     * @throws AlreadyDeactivatedError если кошелёк неактивен
     * @throws LockTimeoutError если блокировку не удалось получить вовремя
     */
    virtual domain::Wallet updateWalletLabel(const domain::Wallet& wallet) = 0;

    virtual std::optional<domain::Wallet> findWalletById(const domain::WalletId& id) = 0;
    virtual std::optional<domain::Wallet> findActiveWalletById(const domain::WalletId& id) = 0;
    virtual bool walletExists(const domain::WalletId& id) = 0;
    virtual std::vector<domain::Wallet> findWalletsByIds(const std::vector<domain::WalletId>& ids) = 0;

    virtual domain::Page<domain::Wallet> listWallets(
        const domain::WalletFilter& filter,
        const domain::PageRequest& request) = 0;

    // =========================================================================
    // Транзакции (только чтение)
    // =========================================================================

    virtual std::optional<domain::Transaction> findTransactionById(const domain::TransactionId& id) = 0;
    virtual std::optional<domain::Transaction> findTransactionByTxid(const domain::TxId& txid) = 0;
    virtual std::optional<domain::Transaction> findActiveTransactionByTxid(const domain::TxId& txid) = 0;
    virtual bool transactionExistsByTxid(const domain::TxId& txid) = 0;

    /// Активные транзакции кошелька, по created_at
    virtual std::vector<domain::Transaction> findActiveTransactionsByWalletId(const domain::WalletId& walletId) = 0;

    /// Активные транзакции набора кошельков, по created_at
    virtual std::vector<domain::Transaction> findActiveTransactionsByWalletIds(
        const std::vector<domain::WalletId>& walletIds) = 0;

    virtual domain::Page<domain::Transaction> listTransactions(
        const domain::TransactionFilter& filter,
        const domain::PageRequest& request) = 0;

    // =========================================================================
    // Атомарные протоколы
    // =========================================================================

    /**
     * @brief Протокол A: создать транзакцию и обновить баланс
     *
     * @param wallet Кошелёк, загруженный вне атомарной области (его баланс игнорируется)
     * @param transaction Новая транзакция этого кошелька
     * @return Сохранённая транзакция и кошелёк с новым балансом
     *
     * @throws InsufficientBalanceError если баланс стал бы отрицательным (ничего не записано)
     * @throws NotFoundError если кошелька нет
     * @throws AlreadyDeactivatedError если кошелёк деактивирован после загрузки
     * @throws ConflictError если txid или id транзакции уже существуют
     * @throws LockTimeoutError если блокировку не удалось получить вовремя
     */
    virtual domain::TransactionResult createTransactionWithBalanceUpdate(
        const domain::Wallet& wallet,
        const domain::Transaction& transaction) = 0;

    /**
     * @brief Протокол B: деактивировать кошелёк и все его активные транзакции
     *
     * @return Кошелёк после каскада; transactions() - деактивированные транзакции
     *
     * @throws NotFoundError если кошелька нет
     * @throws AlreadyDeactivatedError если кошелёк уже неактивен
     * @throws LockTimeoutError если блокировку не удалось получить вовремя
     */
    virtual domain::Wallet deactivateWalletWithTransactions(const domain::WalletId& walletId) = 0;
};

} // namespace ledger::ports::output
