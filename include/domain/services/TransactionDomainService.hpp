// include/domain/services/TransactionDomainService.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "settings/LedgerSettings.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace ledger::domain::services {

/**
 * @brief Доменные операции над транзакциями
 *
 * createTransaction только строит транзакцию в памяти. Запись и баланс -
 * протокол A хранилища, генератор txid к блокировкам не прикасается.
 *
 * Формат txid: tx_<millis>_<1000..9999>. При коллизии перегенерируется
 * случайная часть (не больше LEDGER_TXID_MAX_ATTEMPTS проверок),
 * затем tx_<32 hex>.
 */
class TransactionDomainService {
public:
    static constexpr const char* kTxidPrefix = "tx_";

    TransactionDomainService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<settings::LedgerSettings> settings);

    /**
     * @brief Новая активная транзакция с уникальным txid (не сохраняется)
     * @throws ValidationError если amount == 0
     */
    Transaction createTransaction(const WalletId& walletId, const Money& amount);

    /**
     * @throws NotFoundError если транзакции нет или она неактивна
     */
    Transaction getTransactionByTxid(const TxId& txid);

    bool existsByTxid(const TxId& txid);

    std::vector<Transaction> getTransactionsByWalletId(const WalletId& walletId);
    std::vector<Transaction> getTransactionsByWalletIds(const std::vector<WalletId>& walletIds);

    Page<Transaction> listTransactions(const TransactionFilter& filter, const PageRequest& request);

    TxId generateUniqueTxid();

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    /// Неубывающая миллисекундная часть txid
    std::atomic<int64_t> lastMillis_{0};

    int64_t nextMillis();
};

} // namespace ledger::domain::services
