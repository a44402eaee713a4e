#pragma once

#include "domain/services/TransactionDomainService.hpp"
#include "domain/services/WalletDomainService.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Сценарии, затрагивающие кошелёк и его транзакции вместе
 *
 * Сам ничего не считает и не блокирует: проверяет предусловия через доменные
 * сервисы и отдаёт атомарную часть хранилищу (протоколы A и B).
 * Ошибки хранилища пробрасываются без изменений.
 */
class LedgerOrchestrationService {
public:
    LedgerOrchestrationService(
        std::shared_ptr<domain::services::WalletDomainService> walletService,
        std::shared_ptr<domain::services::TransactionDomainService> transactionService
    ) : walletService_(std::move(walletService))
      , transactionService_(std::move(transactionService))
    {
        std::cout << "[LedgerOrchestrationService] Created" << std::endl;
    }

    /**
     * @brief Создать транзакцию и обновить баланс
     *
     * 1. Активный кошелёк (NotFoundError до любых блокировок)
     * 2. Транзакция с уникальным txid, только в памяти
     * 3. addTransaction без пересчёта баланса
     * 4. Протокол A
     *
     * @return Сохранённая транзакция и кошелёк с балансом из хранилища
     * @throws InsufficientBalanceError, LockTimeoutError без изменений
     */
    domain::TransactionResult createTransactionWithBalanceUpdate(
        const domain::WalletId& walletId,
        const domain::Money& amount)
    {
        auto wallet = walletService_->getWallet(walletId);
        auto transaction = transactionService_->createTransaction(walletId, amount);
        wallet.addTransaction(transaction);

        return walletService_->applyTransaction(wallet, transaction);
    }

    /**
     * @brief Деактивировать кошелёк со всеми активными транзакциями
     *
     * Транзакции здесь не перечисляются: повторное чтение вне блокировки
     * могло бы пропустить транзакцию, созданную параллельно.
     */
    domain::Wallet deactivateWalletWithTransactions(const domain::WalletId& walletId) {
        return walletService_->deactivateWallet(walletId);
    }

    /**
     * @brief Активный кошелёк с активными транзакциями в памяти
     */
    domain::Wallet getWalletWithTransactions(const domain::WalletId& walletId) {
        auto wallet = walletService_->getWallet(walletId);
        // restore, а не addTransaction: updated_at должен остаться как в хранилище
        return domain::Wallet::restore(
            wallet.id(), wallet.label(), wallet.balance(), wallet.isActive(), wallet.deactivatedAt(),
            wallet.createdAt(), wallet.updatedAt(),
            transactionService_->getTransactionsByWalletId(walletId));
    }

private:
    std::shared_ptr<domain::services::WalletDomainService> walletService_;
    std::shared_ptr<domain::services::TransactionDomainService> transactionService_;
};

} // namespace ledger::application
