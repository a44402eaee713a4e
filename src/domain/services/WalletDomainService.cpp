#include "domain/services/WalletDomainService.hpp"
#include "domain/errors/LedgerError.hpp"
#include <iostream>

namespace ledger::domain::services {

WalletDomainService::WalletDomainService(std::shared_ptr<ports::output::ILedgerStore> store)
    : store_(std::move(store))
{
    std::cout << "[WalletDomainService] Created" << std::endl;
}

Wallet WalletDomainService::createWallet(const std::string& label) {
    auto wallet = Wallet::create(WalletId::generate(), label);

    std::cout << "[WalletDomainService] Creating wallet " << wallet.id()
              << " label=" << wallet.label() << std::endl;

    return store_->insertWallet(wallet);
}

Wallet WalletDomainService::getWallet(const WalletId& id) {
    auto wallet = store_->findActiveWalletById(id);
    if (!wallet) {
        throw NotFoundError("Wallet", id.value());
    }
    return *wallet;
}

std::vector<Wallet> WalletDomainService::getWalletsByIds(const std::vector<WalletId>& ids) {
    return store_->findWalletsByIds(ids);
}

Page<Wallet> WalletDomainService::listWallets(const WalletFilter& filter, const PageRequest& request) {
    return store_->listWallets(filter, request);
}

Wallet WalletDomainService::updateWalletLabel(const WalletId& id, const std::string& label) {
    auto wallet = getWallet(id);
    wallet.updateLabel(label);
    return store_->updateWalletLabel(wallet);
}

Wallet WalletDomainService::deactivateWallet(const WalletId& id) {
    auto wallet = store_->findWalletById(id);
    if (!wallet) {
        throw NotFoundError("Wallet", id.value());
    }
    if (!wallet->isActive()) {
        throw AlreadyDeactivatedError("Wallet", id.value());
    }

    // Транзакции кошелька находит и блокирует само хранилище
    return store_->deactivateWalletWithTransactions(id);
}

TransactionResult WalletDomainService::applyTransaction(const Wallet& wallet, const Transaction& transaction) {
    return store_->createTransactionWithBalanceUpdate(wallet, transaction);
}

} // namespace ledger::domain::services
