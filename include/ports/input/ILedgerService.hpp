// include/ports/input/ILedgerService.hpp
#pragma once

#include "domain/Identifiers.hpp"
#include "domain/Money.hpp"
#include "domain/Page.hpp"
#include "domain/Transaction.hpp"
#include "domain/TransactionResult.hpp"
#include "domain/Wallet.hpp"
#include <optional>
#include <string>

namespace ledger::ports::input {

/**
 * @brief Параметры страницы от вызывающего
 *
 * pageSize не задан - берётся LEDGER_DEFAULT_PAGE_SIZE.
 */
struct PageQuery {
    int page = 1;
    std::optional<int> pageSize;
    std::optional<std::string> sort;
};

/**
 * @brief Интерфейс леджера для внешнего слоя (CLI, API)
 *
 * Каждый метод возвращает сущность или бросает LedgerError
 * одного из видов ErrorKind.
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    virtual domain::Wallet createWallet(const std::string& label) = 0;

    /**
     * @brief Активный кошелёк
     */
    virtual domain::Wallet getWallet(const domain::WalletId& id) = 0;

    /**
     * @brief Активный кошелёк вместе с активными транзакциями
     */
    virtual domain::Wallet getWalletWithTransactions(const domain::WalletId& id) = 0;

    virtual domain::Wallet updateWalletLabel(const domain::WalletId& id, const std::string& label) = 0;

    /**
     * @brief Каскадная деактивация
     */
    virtual domain::Wallet deactivateWallet(const domain::WalletId& id) = 0;

    virtual domain::Page<domain::Wallet> listWallets(
        const domain::WalletFilter& filter,
        const PageQuery& query) = 0;

    /**
     * @brief Транзакция с обновлением баланса
     */
    virtual domain::TransactionResult createTransaction(
        const domain::WalletId& walletId,
        const domain::Money& amount) = 0;

    virtual domain::Transaction getTransactionByTxid(const domain::TxId& txid) = 0;

    virtual domain::Page<domain::Transaction> listTransactions(
        const domain::TransactionFilter& filter,
        const PageQuery& query) = 0;
};

} // namespace ledger::ports::input
