// include/adapters/secondary/PostgresLedgerStore.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища
 *
 * Таблица: wallets
 * - id UUID PRIMARY KEY
 * - label VARCHAR(255) NOT NULL
 * - balance NUMERIC(18,0) NOT NULL DEFAULT 0 CHECK (balance >= 0)
 * - is_active BOOLEAN NOT NULL DEFAULT TRUE
 * - deactivated_at, created_at, updated_at TIMESTAMPTZ
 *
 * Таблица: transactions
 * - id UUID PRIMARY KEY
 * - wallet_id UUID NOT NULL REFERENCES wallets(id)
 * - txid VARCHAR(255) NOT NULL UNIQUE
 * - amount NUMERIC(18,0) NOT NULL CHECK (amount <> 0)
 * - is_active, deactivated_at, created_at, updated_at
 *
 * Каждый вызов открывает своё соединение, поэтому параллельные вызовы
 * действительно конкурируют за блокировки строк в БД.
 * Протоколы A и B выставляют SET LOCAL lock_timeout из LEDGER_LOCK_TIMEOUT_MS.
 *
 * Ошибки БД переводятся в доменные:
 * - 23505 unique_violation -> ConflictError
 * - 55P03 lock_not_available, 40P01 deadlock, 40001 serialization -> LockTimeoutError
 */
class PostgresLedgerStore : public ports::output::ILedgerStore {
public:
    PostgresLedgerStore(
        std::shared_ptr<settings::DbSettings> dbSettings,
        std::shared_ptr<settings::LedgerSettings> settings);

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

    /// Удалить все строки (для интеграционных тестов)
    void truncate();

private:
    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    void initSchema();
    void setLockTimeout(pqxx::work& txn) const;

    static domain::Wallet rowToWallet(const pqxx::row& row);
    static domain::Transaction rowToTransaction(const pqxx::row& row);

    /// UUID[] литерал "{a,b,c}" для ANY($n::uuid[])
    static std::string toUuidArray(const std::vector<domain::WalletId>& ids);

    /**
     * @brief Перевести ошибку БД в доменную и бросить
     */
    [[noreturn]] static void rethrowSqlError(const pqxx::sql_error& e, const std::string& context);
};

} // namespace ledger::adapters::secondary
