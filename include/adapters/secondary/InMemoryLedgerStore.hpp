// include/adapters/secondary/InMemoryLedgerStore.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "settings/LedgerSettings.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory реализация хранилища
 *
 * Модель транзакционной БД в памяти процесса:
 * - у каждого кошелька своя блокировка строки (std::timed_mutex), её держат
 *   протоколы A и B от чтения баланса до коммита, как SELECT ... FOR UPDATE;
 * - tableMutex_ защищает таблицы и делает каждый коммит одним видимым шагом,
 *   поэтому читатель никогда не видит частичный каскад.
 *
 * Чтения не берут блокировки строк и не ждут писателей.
 */
class InMemoryLedgerStore : public ports::output::ILedgerStore {
public:
    explicit InMemoryLedgerStore(std::shared_ptr<settings::LedgerSettings> settings);

    domain::Wallet insertWallet(const domain::Wallet& wallet) override;
    domain::Wallet updateWalletLabel(const domain::Wallet& wallet) override;
    std::optional<domain::Wallet> findWalletById(const domain::WalletId& id) override;
    std::optional<domain::Wallet> findActiveWalletById(const domain::WalletId& id) override;
    bool walletExists(const domain::WalletId& id) override;
    std::vector<domain::Wallet> findWalletsByIds(const std::vector<domain::WalletId>& ids) override;
    domain::Page<domain::Wallet> listWallets(
        const domain::WalletFilter& filter,
        const domain::PageRequest& request) override;

    std::optional<domain::Transaction> findTransactionById(const domain::TransactionId& id) override;
    std::optional<domain::Transaction> findTransactionByTxid(const domain::TxId& txid) override;
    std::optional<domain::Transaction> findActiveTransactionByTxid(const domain::TxId& txid) override;
    bool transactionExistsByTxid(const domain::TxId& txid) override;
    std::vector<domain::Transaction> findActiveTransactionsByWalletId(const domain::WalletId& walletId) override;
    std::vector<domain::Transaction> findActiveTransactionsByWalletIds(
        const std::vector<domain::WalletId>& walletIds) override;
    domain::Page<domain::Transaction> listTransactions(
        const domain::TransactionFilter& filter,
        const domain::PageRequest& request) override;

    domain::TransactionResult createTransactionWithBalanceUpdate(
        const domain::Wallet& wallet,
        const domain::Transaction& transaction) override;

    domain::Wallet deactivateWalletWithTransactions(const domain::WalletId& walletId) override;

    /**
     * @brief Эксклюзивная блокировка строки кошелька
     *
     * Ждёт не дольше LEDGER_LOCK_TIMEOUT_MS.
     * Снаружи используется для обслуживания и в тестах на конкуренцию.
     *
     * @throws LockTimeoutError если блокировка не получена вовремя
     */
    std::unique_lock<std::timed_mutex> lockWalletRow(const domain::WalletId& id);

    // Test helpers
    void clear();
    size_t walletCount() const;
    size_t transactionCount() const;

private:
    std::shared_ptr<settings::LedgerSettings> settings_;

    mutable std::mutex tableMutex_;
    std::unordered_map<domain::WalletId, domain::Wallet> wallets_;
    std::unordered_map<domain::TransactionId, domain::Transaction> transactions_;
    std::unordered_map<domain::TxId, domain::TransactionId> txidIndex_;
    std::unordered_map<domain::WalletId, std::vector<domain::TransactionId>> walletTransactions_;

    std::mutex rowLocksMutex_;
    std::unordered_map<domain::WalletId, std::shared_ptr<std::timed_mutex>> rowLocks_;

    std::vector<domain::Transaction> activeTransactionsLocked(const domain::WalletId& walletId) const;
};

} // namespace ledger::adapters::secondary
