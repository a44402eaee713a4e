// include/application/LedgerService.hpp
#pragma once

#include "ports/input/ILedgerService.hpp"
#include "application/LedgerOrchestrationService.hpp"
#include "domain/errors/LedgerError.hpp"
#include "settings/LedgerSettings.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Реализация ILedgerService
 *
 * Проверяет параметры страницы и делегирует доменным сервисам
 * и оркестрации. Ошибки не перехватывает.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    LedgerService(
        std::shared_ptr<domain::services::WalletDomainService> walletService,
        std::shared_ptr<domain::services::TransactionDomainService> transactionService,
        std::shared_ptr<LedgerOrchestrationService> orchestration,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : walletService_(std::move(walletService))
      , transactionService_(std::move(transactionService))
      , orchestration_(std::move(orchestration))
      , settings_(std::move(settings))
    {
        std::cout << "[LedgerService] Created" << std::endl;
    }

    domain::Wallet createWallet(const std::string& label) override {
        return walletService_->createWallet(label);
    }

    domain::Wallet getWallet(const domain::WalletId& id) override {
        return walletService_->getWallet(id);
    }

    domain::Wallet getWalletWithTransactions(const domain::WalletId& id) override {
        return orchestration_->getWalletWithTransactions(id);
    }

    domain::Wallet updateWalletLabel(const domain::WalletId& id, const std::string& label) override {
        return walletService_->updateWalletLabel(id, label);
    }

    domain::Wallet deactivateWallet(const domain::WalletId& id) override {
        return orchestration_->deactivateWalletWithTransactions(id);
    }

    domain::Page<domain::Wallet> listWallets(
        const domain::WalletFilter& filter,
        const ports::input::PageQuery& query) override
    {
        return walletService_->listWallets(filter, toPageRequest(query));
    }

    domain::TransactionResult createTransaction(
        const domain::WalletId& walletId,
        const domain::Money& amount) override
    {
        return orchestration_->createTransactionWithBalanceUpdate(walletId, amount);
    }

    domain::Transaction getTransactionByTxid(const domain::TxId& txid) override {
        return transactionService_->getTransactionByTxid(txid);
    }

    domain::Page<domain::Transaction> listTransactions(
        const domain::TransactionFilter& filter,
        const ports::input::PageQuery& query) override
    {
        return transactionService_->listTransactions(filter, toPageRequest(query));
    }

private:
    std::shared_ptr<domain::services::WalletDomainService> walletService_;
    std::shared_ptr<domain::services::TransactionDomainService> transactionService_;
    std::shared_ptr<LedgerOrchestrationService> orchestration_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    /**
     * @throws ValidationError если page < 1 или page_size вне [1, max]
     */
    domain::PageRequest toPageRequest(const ports::input::PageQuery& query) const {
        if (query.page < 1) {
            throw domain::ValidationError("page", "Page must be >= 1");
        }

        int pageSize = query.pageSize.value_or(settings_->getDefaultPageSize());
        if (pageSize < 1 || pageSize > settings_->getMaxPageSize()) {
            throw domain::ValidationError("page_size",
                "Page size must be between 1 and " + std::to_string(settings_->getMaxPageSize()));
        }

        domain::PageRequest request;
        request.page = query.page;
        request.pageSize = pageSize;
        request.sort = query.sort;
        return request;
    }
};

} // namespace ledger::application
