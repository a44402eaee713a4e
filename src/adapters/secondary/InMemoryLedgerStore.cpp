#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "domain/errors/LedgerError.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace ledger::adapters::secondary {

using domain::Money;
using domain::Page;
using domain::PageRequest;
using domain::SortOrder;
using domain::Timestamp;
using domain::Transaction;
using domain::TransactionId;
using domain::TxId;
using domain::Wallet;
using domain::WalletId;

namespace {

template <typename V>
int threeWay(const V& a, const V& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

int compareWalletField(const Wallet& a, const Wallet& b, const std::string& field) {
    if (field == "balance")    return threeWay(a.balance(), b.balance());
    if (field == "created_at") return threeWay(a.createdAt(), b.createdAt());
    if (field == "updated_at") return threeWay(a.updatedAt(), b.updatedAt());
    if (field == "label")      return threeWay(a.label(), b.label());
    return 0;
}

int compareTransactionField(const Transaction& a, const Transaction& b, const std::string& field) {
    if (field == "created_at") return threeWay(a.createdAt(), b.createdAt());
    if (field == "updated_at") return threeWay(a.updatedAt(), b.updatedAt());
    if (field == "amount")     return threeWay(a.amount(), b.amount());
    if (field == "txid")       return threeWay(a.txid(), b.txid());
    return 0;
}

/**
 * Сортировка по полю, при равенстве - по id по возрастанию,
 * затем вырезание страницы.
 */
template <typename T, typename FieldCompare>
Page<T> paginate(std::vector<T> rows, const PageRequest& request, const SortOrder& order, FieldCompare compareField) {
    if (request.pageSize <= 0) {
        throw domain::ValidationError("page_size", "Page size must be positive");
    }

    std::sort(rows.begin(), rows.end(), [&](const T& a, const T& b) {
        int c = compareField(a, b, order.field);
        if (c != 0) {
            return order.descending ? c > 0 : c < 0;
        }
        return a.id() < b.id();
    });

    auto window = domain::computePageWindow(static_cast<int64_t>(rows.size()), request.page, request.pageSize);

    Page<T> page;
    page.count = static_cast<int64_t>(rows.size());
    page.page = window.page;
    page.pages = window.pages;
    page.pageSize = request.pageSize;

    auto begin = std::min(rows.size(), static_cast<size_t>(window.offset));
    auto end = std::min(rows.size(), begin + static_cast<size_t>(request.pageSize));
    page.items.assign(std::make_move_iterator(rows.begin() + begin), std::make_move_iterator(rows.begin() + end));
    return page;
}

bool matchesIds(const WalletId& id, const std::unordered_set<WalletId>& ids) {
    return ids.empty() || ids.count(id) > 0;
}

void sortByCreatedAt(std::vector<Transaction>& txs) {
    std::sort(txs.begin(), txs.end(), [](const Transaction& a, const Transaction& b) {
        if (a.createdAt() != b.createdAt()) return a.createdAt() < b.createdAt();
        return a.id() < b.id();
    });
}

} // namespace

InMemoryLedgerStore::InMemoryLedgerStore(std::shared_ptr<settings::LedgerSettings> settings)
    : settings_(std::move(settings))
{
    std::cout << "[InMemoryLedgerStore] Created, lock timeout "
              << settings_->getLockTimeout().count() << "ms" << std::endl;
}

// =============================================================================
// Кошельки
// =============================================================================

Wallet InMemoryLedgerStore::insertWallet(const Wallet& wallet) {
    std::lock_guard<std::mutex> lock(tableMutex_);

    if (wallets_.count(wallet.id()) > 0) {
        throw domain::ConflictError("wallet id " + wallet.id().value());
    }

    // Транзакции в хранилище попадают только через протокол A
    auto row = Wallet::restore(
        wallet.id(), wallet.label(), wallet.balance(), wallet.isActive(),
        wallet.deactivatedAt(), wallet.createdAt(), wallet.updatedAt());
    wallets_.emplace(wallet.id(), row);

    std::cout << "[InMemoryLedgerStore] Inserted wallet " << wallet.id() << std::endl;
    return row;
}

Wallet InMemoryLedgerStore::updateWalletLabel(const Wallet& wallet) {
    // Та же блокировка строки, что у протоколов A и B
    auto rowLock = lockWalletRow(wallet.id());
    std::lock_guard<std::mutex> lock(tableMutex_);

    auto it = wallets_.find(wallet.id());
    if (it == wallets_.end()) {
        throw domain::NotFoundError("Wallet", wallet.id().value());
    }
    if (!it->second.isActive()) {
        throw domain::AlreadyDeactivatedError("Wallet", wallet.id().value());
    }

    const Wallet& current = it->second;
    auto updated = Wallet::restore(
        current.id(), wallet.label(), current.balance(), current.isActive(),
        current.deactivatedAt(), current.createdAt(), std::max(wallet.updatedAt(), current.updatedAt()));
    it->second = updated;
    return updated;
}

std::optional<Wallet> InMemoryLedgerStore::findWalletById(const WalletId& id) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto it = wallets_.find(id);
    if (it == wallets_.end()) return std::nullopt;
    return it->second;
}

std::optional<Wallet> InMemoryLedgerStore::findActiveWalletById(const WalletId& id) {
    auto wallet = findWalletById(id);
    if (!wallet || !wallet->isActive()) return std::nullopt;
    return wallet;
}

bool InMemoryLedgerStore::walletExists(const WalletId& id) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return wallets_.count(id) > 0;
}

std::vector<Wallet> InMemoryLedgerStore::findWalletsByIds(const std::vector<WalletId>& ids) {
    std::lock_guard<std::mutex> lock(tableMutex_);

    std::vector<Wallet> result;
    std::unordered_set<WalletId> seen;
    for (const auto& id : ids) {
        auto it = wallets_.find(id);
        if (it != wallets_.end() && seen.insert(id).second) {
            result.push_back(it->second);
        }
    }

    std::sort(result.begin(), result.end(), [](const Wallet& a, const Wallet& b) {
        if (a.createdAt() != b.createdAt()) return a.createdAt() < b.createdAt();
        return a.id() < b.id();
    });
    return result;
}

Page<Wallet> InMemoryLedgerStore::listWallets(const domain::WalletFilter& filter, const PageRequest& request) {
    auto order = domain::resolveSort(request.sort, domain::sorting::walletFields(), domain::sorting::defaultWalletSort());
    std::unordered_set<WalletId> ids(filter.walletIds.begin(), filter.walletIds.end());

    std::vector<Wallet> rows;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        for (const auto& [id, wallet] : wallets_) {
            if (filter.isActive && wallet.isActive() != *filter.isActive) continue;
            if (!matchesIds(id, ids)) continue;
            rows.push_back(wallet);
        }
    }

    return paginate(std::move(rows), request, order, compareWalletField);
}

// =============================================================================
// Транзакции
// =============================================================================

std::optional<Transaction> InMemoryLedgerStore::findTransactionById(const TransactionId& id) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto it = transactions_.find(id);
    if (it == transactions_.end()) return std::nullopt;
    return it->second;
}

std::optional<Transaction> InMemoryLedgerStore::findTransactionByTxid(const TxId& txid) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto idx = txidIndex_.find(txid);
    if (idx == txidIndex_.end()) return std::nullopt;
    return transactions_.at(idx->second);
}

std::optional<Transaction> InMemoryLedgerStore::findActiveTransactionByTxid(const TxId& txid) {
    auto tx = findTransactionByTxid(txid);
    if (!tx || !tx->isActive()) return std::nullopt;
    return tx;
}

bool InMemoryLedgerStore::transactionExistsByTxid(const TxId& txid) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return txidIndex_.count(txid) > 0;
}

std::vector<Transaction> InMemoryLedgerStore::findActiveTransactionsByWalletId(const WalletId& walletId) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return activeTransactionsLocked(walletId);
}

std::vector<Transaction> InMemoryLedgerStore::findActiveTransactionsByWalletIds(const std::vector<WalletId>& walletIds) {
    std::unordered_set<WalletId> unique(walletIds.begin(), walletIds.end());

    std::vector<Transaction> result;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        for (const auto& walletId : unique) {
            auto txs = activeTransactionsLocked(walletId);
            result.insert(result.end(), txs.begin(), txs.end());
        }
    }

    sortByCreatedAt(result);
    return result;
}

Page<Transaction> InMemoryLedgerStore::listTransactions(const domain::TransactionFilter& filter, const PageRequest& request) {
    auto order = domain::resolveSort(request.sort, domain::sorting::transactionFields(), domain::sorting::defaultTransactionSort());
    std::unordered_set<WalletId> ids(filter.walletIds.begin(), filter.walletIds.end());

    std::vector<Transaction> rows;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        for (const auto& [id, tx] : transactions_) {
            if (filter.isActive && tx.isActive() != *filter.isActive) continue;
            if (!matchesIds(tx.walletId(), ids)) continue;
            rows.push_back(tx);
        }
    }

    return paginate(std::move(rows), request, order, compareTransactionField);
}

// =============================================================================
// Протокол A: транзакция + баланс
// =============================================================================

domain::TransactionResult InMemoryLedgerStore::createTransactionWithBalanceUpdate(
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

    // 1. Эксклюзивная блокировка строки кошелька до конца метода
    auto rowLock = lockWalletRow(wallet.id());

    // 2. Баланс перечитывается под блокировкой, значение из wallet не используется
    std::optional<Wallet> current;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        auto it = wallets_.find(wallet.id());
        if (it != wallets_.end()) {
            current = it->second;
        }
    }
    if (!current) {
        throw domain::NotFoundError("Wallet", wallet.id().value());
    }
    if (!current->isActive()) {
        throw domain::AlreadyDeactivatedError("Wallet", wallet.id().value());
    }

    // 3-4. Новый баланс и проверка на отрицательность
    Money newBalance = current->balance() + transaction.amount();
    if (newBalance.isNegative()) {
        std::cout << "[InMemoryLedgerStore] Rejected " << transaction.txid() << " on wallet " << wallet.id()
                  << ": balance " << current->balance() << " + " << transaction.amount()
                  << " < 0" << std::endl;
        throw domain::InsufficientBalanceError(current->balance(), transaction.amount(), newBalance);
    }

    auto updatedAt = std::max(Timestamp::now(), current->updatedAt());
    std::optional<Wallet> updated;

    // 5. Вставка транзакции и новый баланс одним коммитом
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        if (txidIndex_.count(transaction.txid()) > 0) {
            throw domain::ConflictError("txid " + transaction.txid().value());
        }
        if (transactions_.count(transaction.id()) > 0) {
            throw domain::ConflictError("transaction id " + transaction.id().value());
        }

        transactions_.emplace(transaction.id(), transaction);
        txidIndex_.emplace(transaction.txid(), transaction.id());
        walletTransactions_[wallet.id()].push_back(transaction.id());

        // Строка собирается из текущей записи: меняются только баланс и updated_at
        const Wallet& live = wallets_.at(wallet.id());
        updated = Wallet::restore(
            live.id(), live.label(), newBalance, true, std::nullopt,
            live.createdAt(), std::max(updatedAt, live.updatedAt()));
        wallets_.insert_or_assign(wallet.id(), *updated);
    }

    std::cout << "[InMemoryLedgerStore] Committed " << transaction.txid() << " amount=" << transaction.amount()
              << " wallet=" << wallet.id() << " balance=" << newBalance << std::endl;

    // 6. Блокировка снимается при выходе из области видимости
    return domain::TransactionResult{
        transaction,
        Wallet::restore(updated->id(), updated->label(), updated->balance(), true, std::nullopt,
                        updated->createdAt(), updated->updatedAt(), {transaction})};
}

// =============================================================================
// Протокол B: каскадная деактивация
// =============================================================================

Wallet InMemoryLedgerStore::deactivateWalletWithTransactions(const WalletId& walletId) {
    // 1. Блокировка кошелька. Новые транзакции этого кошелька создаются только
    //    протоколом A под той же блокировкой, поэтому набор активных транзакций
    //    ниже не может измениться до коммита.
    auto rowLock = lockWalletRow(walletId);

    std::optional<Wallet> current;
    std::vector<Transaction> active;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        auto it = wallets_.find(walletId);
        if (it != wallets_.end()) {
            current = it->second;
            // 2. Все активные транзакции из хранилища, а не из памяти вызывающего
            active = activeTransactionsLocked(walletId);
        }
    }
    if (!current) {
        throw domain::NotFoundError("Wallet", walletId.value());
    }
    if (!current->isActive()) {
        throw domain::AlreadyDeactivatedError("Wallet", walletId.value());
    }

    // 3. Деактивация транзакций и сумма их amount
    auto now = std::max(Timestamp::now(), current->updatedAt());
    Money deactivatedTotal;
    std::vector<Transaction> deactivated;
    deactivated.reserve(active.size());
    for (const auto& tx : active) {
        auto stamp = std::max(now, tx.updatedAt());
        deactivated.push_back(Transaction::restore(
            tx.id(), tx.walletId(), tx.txid(), tx.amount(),
            false, stamp, tx.createdAt(), stamp));
        deactivatedTotal += tx.amount();
    }

    // 4. Баланс без деактивированных транзакций; по инварианту это ноль
    Money newBalance = current->balance() - deactivatedTotal;
    std::optional<Wallet> updated;

    // 5. Один коммит для кошелька и всех транзакций
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        for (const auto& tx : deactivated) {
            transactions_.insert_or_assign(tx.id(), tx);
        }

        const Wallet& live = wallets_.at(walletId);
        auto stamp = std::max(now, live.updatedAt());
        updated = Wallet::restore(
            live.id(), live.label(), newBalance, false, stamp,
            live.createdAt(), stamp);
        wallets_.insert_or_assign(walletId, *updated);
    }

    std::cout << "[InMemoryLedgerStore] Deactivated wallet " << walletId << " with "
              << deactivated.size() << " transactions, total " << deactivatedTotal << std::endl;

    return Wallet::restore(
        updated->id(), updated->label(), updated->balance(), false, updated->deactivatedAt(),
        updated->createdAt(), updated->updatedAt(), std::move(deactivated));
}

// =============================================================================
// Блокировки строк
// =============================================================================

std::unique_lock<std::timed_mutex> InMemoryLedgerStore::lockWalletRow(const WalletId& id) {
    std::shared_ptr<std::timed_mutex> rowMutex;
    {
        std::lock_guard<std::mutex> lock(rowLocksMutex_);
        auto& slot = rowLocks_[id];
        if (!slot) {
            slot = std::make_shared<std::timed_mutex>();
        }
        rowMutex = slot;
    }

    // Мьютексы строк не удаляются из rowLocks_, поэтому ссылка остаётся валидной
    std::unique_lock<std::timed_mutex> rowLock(*rowMutex, std::defer_lock);
    if (!rowLock.try_lock_for(settings_->getLockTimeout())) {
        std::cerr << "[InMemoryLedgerStore] Lock timeout on wallet " << id << std::endl;
        throw domain::LockTimeoutError("wallet " + id.value());
    }
    return rowLock;
}

void InMemoryLedgerStore::clear() {
    std::lock_guard<std::mutex> lock(tableMutex_);
    wallets_.clear();
    transactions_.clear();
    txidIndex_.clear();
    walletTransactions_.clear();
}

size_t InMemoryLedgerStore::walletCount() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return wallets_.size();
}

size_t InMemoryLedgerStore::transactionCount() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return transactions_.size();
}

std::vector<Transaction> InMemoryLedgerStore::activeTransactionsLocked(const WalletId& walletId) const {
    std::vector<Transaction> result;
    auto it = walletTransactions_.find(walletId);
    if (it == walletTransactions_.end()) {
        return result;
    }

    for (const auto& txId : it->second) {
        const auto& tx = transactions_.at(txId);
        if (tx.isActive()) {
            result.push_back(tx);
        }
    }
    sortByCreatedAt(result);
    return result;
}

} // namespace ledger::adapters::secondary
