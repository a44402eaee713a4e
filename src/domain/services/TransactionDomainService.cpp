#include "domain/services/TransactionDomainService.hpp"
#include "domain/errors/LedgerError.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace ledger::domain::services {

TransactionDomainService::TransactionDomainService(
    std::shared_ptr<ports::output::ILedgerStore> store,
    std::shared_ptr<settings::LedgerSettings> settings)
    : store_(std::move(store))
    , settings_(std::move(settings))
{
    std::cout << "[TransactionDomainService] Created" << std::endl;
}

Transaction TransactionDomainService::createTransaction(const WalletId& walletId, const Money& amount) {
    return Transaction::create(TransactionId::generate(), walletId, generateUniqueTxid(), amount);
}

Transaction TransactionDomainService::getTransactionByTxid(const TxId& txid) {
    auto tx = store_->findActiveTransactionByTxid(txid);
    if (!tx) {
        throw NotFoundError("Transaction", txid.value());
    }
    return *tx;
}

bool TransactionDomainService::existsByTxid(const TxId& txid) {
    return store_->transactionExistsByTxid(txid);
}

std::vector<Transaction> TransactionDomainService::getTransactionsByWalletId(const WalletId& walletId) {
    return store_->findActiveTransactionsByWalletId(walletId);
}

std::vector<Transaction> TransactionDomainService::getTransactionsByWalletIds(const std::vector<WalletId>& walletIds) {
    return store_->findActiveTransactionsByWalletIds(walletIds);
}

Page<Transaction> TransactionDomainService::listTransactions(const TransactionFilter& filter, const PageRequest& request) {
    return store_->listTransactions(filter, request);
}

TxId TransactionDomainService::generateUniqueTxid() {
    const std::string base = kTxidPrefix + std::to_string(nextMillis()) + "_";
    const int maxAttempts = settings_->getTxidMaxAttempts();

    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        TxId candidate(base + std::to_string(utils::UuidGenerator::randomInt(1000, 9999)));
        if (!existsByTxid(candidate)) {
            return candidate;
        }
    }

    // 128 случайных бит: коллизия практически исключена, уникальность всё равно держит БД
    TxId fallback(kTxidPrefix + utils::UuidGenerator::generateHex128());
    std::cout << "[TransactionDomainService] txid collisions exhausted " << maxAttempts
              << " attempts, using " << fallback << std::endl;
    return fallback;
}

int64_t TransactionDomainService::nextMillis() {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    int64_t last = lastMillis_.load();
    while (now > last && !lastMillis_.compare_exchange_weak(last, now)) {
    }
    return std::max<int64_t>(now, lastMillis_.load());
}

} // namespace ledger::domain::services
