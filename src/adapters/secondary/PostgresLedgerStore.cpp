#include "adapters/secondary/PostgresLedgerStore.hpp"
#include "domain/errors/LedgerError.hpp"
#include <algorithm>
#include <iostream>

namespace ledger::adapters::secondary {

using domain::Money;
using domain::Page;
using domain::PageRequest;
using domain::Timestamp;
using domain::Transaction;
using domain::TransactionId;
using domain::TxId;
using domain::Wallet;
using domain::WalletId;

namespace {

// Метки времени читаются как ISO 8601 UTC с микросекундами
const char* const kWalletColumns =
    "id::text AS id, label, balance::bigint AS balance, is_active, "
    "to_char(deactivated_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"') AS deactivated_at, "
    "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"') AS created_at, "
    "to_char(updated_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"') AS updated_at";

const char* const kTransactionColumns =
    "id::text AS id, wallet_id::text AS wallet_id, txid, amount::bigint AS amount, is_active, "
    "to_char(deactivated_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"') AS deactivated_at, "
    "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"') AS created_at, "
    "to_char(updated_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"') AS updated_at";

std::optional<std::string> optionalTimestamp(const std::optional<Timestamp>& ts) {
    if (!ts) return std::nullopt;
    return ts->toString();
}

std::optional<Timestamp> readOptionalTimestamp(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return Timestamp::fromString(field.as<std::string>());
}

std::string orderBy(const domain::SortOrder& order) {
    // Поле уже проверено по списку разрешённых, подстановка безопасна
    return " ORDER BY " + order.field + (order.descending ? " DESC" : " ASC") + ", id ASC";
}

/// Условие фильтра: $1 - is_active или NULL, $2 - массив id (пустой = без фильтра)
std::string filterClause(const std::string& idColumn) {
    return " WHERE ($1::boolean IS NULL OR is_active = $1::boolean)"
           " AND (cardinality($2::uuid[]) = 0 OR " + idColumn + " = ANY($2::uuid[]))";
}

} // namespace

PostgresLedgerStore::PostgresLedgerStore(
    std::shared_ptr<settings::DbSettings> dbSettings,
    std::shared_ptr<settings::LedgerSettings> settings)
    : dbSettings_(std::move(dbSettings))
    , settings_(std::move(settings))
{
    initSchema();
}

// =============================================================================
// Кошельки
// =============================================================================

Wallet PostgresLedgerStore::insertWallet(const Wallet& wallet) {
    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("INSERT INTO wallets (id, label, balance, is_active, deactivated_at, created_at, updated_at) "
                        "VALUES ($1::uuid, $2, $3, $4, $5::timestamptz, $6::timestamptz, $7::timestamptz) "
                        "RETURNING ") + kWalletColumns,
            wallet.id().value(),
            wallet.label(),
            wallet.balance().value(),
            wallet.isActive(),
            optionalTimestamp(wallet.deactivatedAt()),
            wallet.createdAt().toString(),
            wallet.updatedAt().toString()
        );

        txn.commit();
        std::cout << "[PostgresLedgerStore] Inserted wallet " << wallet.id() << std::endl;
        return rowToWallet(result[0]);

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "insertWallet");
    }
}

Wallet PostgresLedgerStore::updateWalletLabel(const Wallet& wallet) {
    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);
        setLockTimeout(txn);

        // UPDATE ждёт блокировку строки, is_active перепроверяется после протокола B
        auto result = txn.exec_params(
            std::string("UPDATE wallets SET label = $2, "
                        "updated_at = GREATEST(updated_at, $3::timestamptz) "
                        "WHERE id = $1::uuid AND is_active RETURNING ") + kWalletColumns,
            wallet.id().value(),
            wallet.label(),
            wallet.updatedAt().toString()
        );

        if (result.empty()) {
            auto exists = txn.exec_params("SELECT 1 FROM wallets WHERE id = $1::uuid", wallet.id().value());
            if (exists.empty()) {
                throw domain::NotFoundError("Wallet", wallet.id().value());
            }
            throw domain::AlreadyDeactivatedError("Wallet", wallet.id().value());
        }

        txn.commit();
        return rowToWallet(result[0]);

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "updateWalletLabel");
    }
}

std::optional<Wallet> PostgresLedgerStore::findWalletById(const WalletId& id) {
    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + kWalletColumns + " FROM wallets WHERE id = $1::uuid",
            id.value()
        );

        txn.commit();
        if (result.empty()) return std::nullopt;
        return rowToWallet(result[0]);

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "findWalletById");
    }
}

std::optional<Wallet> PostgresLedgerStore::findActiveWalletById(const WalletId& id) {
    auto wallet = findWalletById(id);
    if (!wallet || !wallet->isActive()) return std::nullopt;
    return wallet;
}

bool PostgresLedgerStore::walletExists(const WalletId& id) {
    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT EXISTS (SELECT 1 FROM wallets WHERE id = $1::uuid)",
            id.value()
        );

        txn.commit();
        return result[0][0].as<bool>();

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "walletExists");
    }
}

std::vector<Wallet> PostgresLedgerStore::findWalletsByIds(const std::vector<WalletId>& ids) {
    if (ids.empty()) {
        return {};
    }

    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + kWalletColumns +
                " FROM wallets WHERE id = ANY($1::uuid[]) ORDER BY created_at ASC, id ASC",
            toUuidArray(ids)
        );

        txn.commit();

        std::vector<Wallet> wallets;
        for (const auto& row : result) {
            wallets.push_back(rowToWallet(row));
        }
        return wallets;

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "findWalletsByIds");
    }
}

Page<Wallet> PostgresLedgerStore::listWallets(const domain::WalletFilter& filter, const PageRequest& request) {
    if (request.pageSize <= 0) {
        throw domain::ValidationError("page_size", "Page size must be positive");
    }
    auto order = domain::resolveSort(request.sort, domain::sorting::walletFields(), domain::sorting::defaultWalletSort());
    auto where = filterClause("id");
    auto ids = toUuidArray(filter.walletIds);

    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);

        auto total = txn.exec_params("SELECT COUNT(*) FROM wallets" + where, filter.isActive, ids);
        auto count = total[0][0].as<int64_t>();
        auto window = domain::computePageWindow(count, request.page, request.pageSize);

        auto result = txn.exec_params(
            std::string("SELECT ") + kWalletColumns + " FROM wallets" + where + orderBy(order) +
                " LIMIT $3 OFFSET $4",
            filter.isActive, ids, request.pageSize, window.offset
        );

        txn.commit();

        Page<Wallet> page;
        page.count = count;
        page.page = window.page;
        page.pages = window.pages;
        page.pageSize = request.pageSize;
        for (const auto& row : result) {
            page.items.push_back(rowToWallet(row));
        }
        return page;

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "listWallets");
    }
}

// =============================================================================
// Транзакции
// =============================================================================

std::optional<Transaction> PostgresLedgerStore::findTransactionById(const TransactionId& id) {
    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + kTransactionColumns + " FROM transactions WHERE id = $1::uuid",
            id.value()
        );

        txn.commit();
        if (result.empty()) return std::nullopt;
        return rowToTransaction(result[0]);

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "findTransactionById");
    }
}

std::optional<Transaction> PostgresLedgerStore::findTransactionByTxid(const TxId& txid) {
    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + kTransactionColumns + " FROM transactions WHERE txid = $1",
            txid.value()
        );

        txn.commit();
        if (result.empty()) return std::nullopt;
        return rowToTransaction(result[0]);

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "findTransactionByTxid");
    }
}

std::optional<Transaction> PostgresLedgerStore::findActiveTransactionByTxid(const TxId& txid) {
    auto tx = findTransactionByTxid(txid);
    if (!tx || !tx->isActive()) return std::nullopt;
    return tx;
}

bool PostgresLedgerStore::transactionExistsByTxid(const TxId& txid) {
    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT EXISTS (SELECT 1 FROM transactions WHERE txid = $1)",
            txid.value()
        );

        txn.commit();
        return result[0][0].as<bool>();

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "transactionExistsByTxid");
    }
}

std::vector<Transaction> PostgresLedgerStore::findActiveTransactionsByWalletId(const WalletId& walletId) {
    return findActiveTransactionsByWalletIds({walletId});
}

std::vector<Transaction> PostgresLedgerStore::findActiveTransactionsByWalletIds(const std::vector<WalletId>& walletIds) {
    if (walletIds.empty()) {
        return {};
    }

    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + kTransactionColumns +
                " FROM transactions WHERE wallet_id = ANY($1::uuid[]) AND is_active"
                " ORDER BY created_at ASC, id ASC",
            toUuidArray(walletIds)
        );

        txn.commit();

        std::vector<Transaction> transactions;
        for (const auto& row : result) {
            transactions.push_back(rowToTransaction(row));
        }
        return transactions;

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "findActiveTransactionsByWalletIds");
    }
}

Page<Transaction> PostgresLedgerStore::listTransactions(const domain::TransactionFilter& filter, const PageRequest& request) {
    if (request.pageSize <= 0) {
        throw domain::ValidationError("page_size", "Page size must be positive");
    }
    auto order = domain::resolveSort(request.sort, domain::sorting::transactionFields(), domain::sorting::defaultTransactionSort());
    auto where = filterClause("wallet_id");
    auto ids = toUuidArray(filter.walletIds);

    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);

        auto total = txn.exec_params("SELECT COUNT(*) FROM transactions" + where, filter.isActive, ids);
        auto count = total[0][0].as<int64_t>();
        auto window = domain::computePageWindow(count, request.page, request.pageSize);

        auto result = txn.exec_params(
            std::string("SELECT ") + kTransactionColumns + " FROM transactions" + where + orderBy(order) +
                " LIMIT $3 OFFSET $4",
            filter.isActive, ids, request.pageSize, window.offset
        );

        txn.commit();

        Page<Transaction> page;
        page.count = count;
        page.page = window.page;
        page.pages = window.pages;
        page.pageSize = request.pageSize;
        for (const auto& row : result) {
            page.items.push_back(rowToTransaction(row));
        }
        return page;

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "listTransactions");
    }
}

// =============================================================================
// Протокол A
// =============================================================================

domain::TransactionResult PostgresLedgerStore::createTransactionWithBalanceUpdate(
    const Wallet& wallet,
    const Transaction& transaction)
{
    if (transaction.walletId() != wallet.id()) {
        throw domain::ValidationError("wallet_id",
            "Transaction " + transaction.id().value() + " does not belong to wallet " + wallet.id().value());
    }
    if (!transaction.isActive()) {
        throw domain::ValidationError("is_active", "Cannot persist an inactive transaction");
    }

    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);
        setLockTimeout(txn);

        // 1-2. Блокировка строки и свежий баланс
        auto locked = txn.exec_params(
            std::string("SELECT ") + kWalletColumns + " FROM wallets WHERE id = $1::uuid FOR UPDATE",
            wallet.id().value()
        );
        if (locked.empty()) {
            throw domain::NotFoundError("Wallet", wallet.id().value());
        }
        auto current = rowToWallet(locked[0]);
        if (!current.isActive()) {
            throw domain::AlreadyDeactivatedError("Wallet", wallet.id().value());
        }

        // 3-4. Проверка неотрицательности до любой записи
        Money newBalance = current.balance() + transaction.amount();
        if (newBalance.isNegative()) {
            std::cout << "[PostgresLedgerStore] Rejected " << transaction.txid() << " on wallet " << wallet.id()
                      << ": balance " << current.balance() << " + " << transaction.amount()
                      << " < 0" << std::endl;
            throw domain::InsufficientBalanceError(current.balance(), transaction.amount(), newBalance);
        }

        // 5. Транзакция и баланс в одном коммите
        auto inserted = txn.exec_params(
            std::string("INSERT INTO transactions "
                        "(id, wallet_id, txid, amount, is_active, deactivated_at, created_at, updated_at) "
                        "VALUES ($1::uuid, $2::uuid, $3, $4, TRUE, NULL, $5::timestamptz, $6::timestamptz) "
                        "RETURNING ") + kTransactionColumns,
            transaction.id().value(),
            transaction.walletId().value(),
            transaction.txid().value(),
            transaction.amount().value(),
            transaction.createdAt().toString(),
            transaction.updatedAt().toString()
        );

        auto updatedAt = std::max(Timestamp::now(), current.updatedAt());
        auto updated = txn.exec_params(
            std::string("UPDATE wallets SET balance = $2, updated_at = $3::timestamptz "
                        "WHERE id = $1::uuid RETURNING ") + kWalletColumns,
            wallet.id().value(),
            newBalance.value(),
            updatedAt.toString()
        );

        txn.commit();

        auto savedTx = rowToTransaction(inserted[0]);
        auto savedWallet = rowToWallet(updated[0]);

        std::cout << "[PostgresLedgerStore] Committed " << transaction.txid() << " amount=" << transaction.amount()
                  << " wallet=" << wallet.id() << " balance=" << newBalance << std::endl;

        return domain::TransactionResult{
            savedTx,
            Wallet::restore(savedWallet.id(), savedWallet.label(), savedWallet.balance(), true, std::nullopt,
                            savedWallet.createdAt(), savedWallet.updatedAt(), {savedTx})};

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "createTransactionWithBalanceUpdate");
    }
}

// =============================================================================
// Протокол B
// =============================================================================

Wallet PostgresLedgerStore::deactivateWalletWithTransactions(const WalletId& walletId) {
    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);
        setLockTimeout(txn);

        auto locked = txn.exec_params(
            std::string("SELECT ") + kWalletColumns + " FROM wallets WHERE id = $1::uuid FOR UPDATE",
            walletId.value()
        );
        if (locked.empty()) {
            throw domain::NotFoundError("Wallet", walletId.value());
        }
        auto current = rowToWallet(locked[0]);
        if (!current.isActive()) {
            throw domain::AlreadyDeactivatedError("Wallet", walletId.value());
        }

        // Активные транзакции блокируются тем же оператором, что и читаются
        auto active = txn.exec_params(
            "SELECT id FROM transactions WHERE wallet_id = $1::uuid AND is_active FOR UPDATE",
            walletId.value()
        );

        auto now = std::max(Timestamp::now(), current.updatedAt());

        auto deactivated = txn.exec_params(
            std::string("UPDATE transactions SET is_active = FALSE, "
                        "deactivated_at = GREATEST(updated_at, $2::timestamptz), "
                        "updated_at = GREATEST(updated_at, $2::timestamptz) "
                        "WHERE wallet_id = $1::uuid AND is_active RETURNING ") + kTransactionColumns,
            walletId.value(),
            now.toString()
        );

        Money deactivatedTotal;
        std::vector<Transaction> transactions;
        for (const auto& row : deactivated) {
            transactions.push_back(rowToTransaction(row));
            deactivatedTotal += transactions.back().amount();
        }
        std::sort(transactions.begin(), transactions.end(), [](const Transaction& a, const Transaction& b) {
            if (a.createdAt() != b.createdAt()) return a.createdAt() < b.createdAt();
            return a.id() < b.id();
        });

        Money newBalance = current.balance() - deactivatedTotal;
        auto updated = txn.exec_params(
            std::string("UPDATE wallets SET balance = $2, is_active = FALSE, "
                        "deactivated_at = $3::timestamptz, updated_at = $3::timestamptz "
                        "WHERE id = $1::uuid RETURNING ") + kWalletColumns,
            walletId.value(),
            newBalance.value(),
            now.toString()
        );

        txn.commit();

        std::cout << "[PostgresLedgerStore] Deactivated wallet " << walletId << " with "
                  << active.size() << " transactions, total " << deactivatedTotal << std::endl;

        auto saved = rowToWallet(updated[0]);
        return Wallet::restore(
            saved.id(), saved.label(), saved.balance(), false, saved.deactivatedAt(),
            saved.createdAt(), saved.updatedAt(), std::move(transactions));

    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "deactivateWalletWithTransactions");
    }
}

void PostgresLedgerStore::truncate() {
    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);
        txn.exec("TRUNCATE transactions, wallets");
        txn.commit();
    } catch (const pqxx::sql_error& e) {
        rethrowSqlError(e, "truncate");
    }
}

// =============================================================================
// Private
// =============================================================================

void PostgresLedgerStore::initSchema() {
    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS wallets (
                id UUID PRIMARY KEY,
                label VARCHAR(255) NOT NULL,
                balance NUMERIC(18,0) NOT NULL DEFAULT 0 CHECK (balance >= 0),
                is_active BOOLEAN NOT NULL DEFAULT TRUE,
                deactivated_at TIMESTAMPTZ,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS transactions (
                id UUID PRIMARY KEY,
                wallet_id UUID NOT NULL REFERENCES wallets(id),
                txid VARCHAR(255) NOT NULL UNIQUE,
                amount NUMERIC(18,0) NOT NULL CHECK (amount <> 0),
                is_active BOOLEAN NOT NULL DEFAULT TRUE,
                deactivated_at TIMESTAMPTZ,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_transactions_wallet_active ON transactions (wallet_id, is_active)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_wallets_is_active ON wallets (is_active)");

        txn.commit();
        std::cout << "[PostgresLedgerStore] Schema initialized" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "[PostgresLedgerStore] initSchema error: " << e.what() << std::endl;
        throw;
    }
}

void PostgresLedgerStore::setLockTimeout(pqxx::work& txn) const {
    txn.exec("SET LOCAL lock_timeout = '" + std::to_string(settings_->getLockTimeout().count()) + "ms'");
}

Wallet PostgresLedgerStore::rowToWallet(const pqxx::row& row) {
    return Wallet::restore(
        WalletId::parse(row["id"].as<std::string>()),
        row["label"].as<std::string>(),
        Money(row["balance"].as<int64_t>()),
        row["is_active"].as<bool>(),
        readOptionalTimestamp(row["deactivated_at"]),
        Timestamp::fromString(row["created_at"].as<std::string>()),
        Timestamp::fromString(row["updated_at"].as<std::string>())
    );
}

Transaction PostgresLedgerStore::rowToTransaction(const pqxx::row& row) {
    return Transaction::restore(
        TransactionId::parse(row["id"].as<std::string>()),
        WalletId::parse(row["wallet_id"].as<std::string>()),
        TxId(row["txid"].as<std::string>()),
        Money(row["amount"].as<int64_t>()),
        row["is_active"].as<bool>(),
        readOptionalTimestamp(row["deactivated_at"]),
        Timestamp::fromString(row["created_at"].as<std::string>()),
        Timestamp::fromString(row["updated_at"].as<std::string>())
    );
}

std::string PostgresLedgerStore::toUuidArray(const std::vector<WalletId>& ids) {
    std::string literal = "{";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) literal += ",";
        literal += ids[i].value();
    }
    literal += "}";
    return literal;
}

void PostgresLedgerStore::rethrowSqlError(const pqxx::sql_error& e, const std::string& context) {
    const std::string state = e.sqlstate();
    std::cerr << "[PostgresLedgerStore] " << context << " error (" << state << "): " << e.what() << std::endl;

    if (state == "23505") {
        throw domain::ConflictError(context + ": " + e.what());
    }
    if (state == "55P03" || state == "40P01" || state == "40001") {
        throw domain::LockTimeoutError(context);
    }
    throw;
}

} // namespace ledger::adapters::secondary
