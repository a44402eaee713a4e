// include/domain/services/WalletDomainService.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ledger::domain::services {

/**
 * @brief Доменные операции над кошельками поверх хранилища
 *
 * getWallet видит только активные кошельки: неактивный для вызывающего
 * то же самое, что отсутствующий.
 */
class WalletDomainService {
public:
    explicit WalletDomainService(std::shared_ptr<ports::output::ILedgerStore> store);

    /**
     * @brief Новый кошелёк с нулевым балансом
     * @throws ValidationError если метка пустая после trim
     */
    Wallet createWallet(const std::string& label);

    /**
     * @throws NotFoundError если кошелька нет или он неактивен
     */
    Wallet getWallet(const WalletId& id);

    std::vector<Wallet> getWalletsByIds(const std::vector<WalletId>& ids);

    Page<Wallet> listWallets(const WalletFilter& filter, const PageRequest& request);

    /**
     * @throws NotFoundError если кошелька нет или он неактивен
     * @throws ValidationError если метка пустая после trim
     */
    Wallet updateWalletLabel(const WalletId& id, const std::string& label);

    /**
     * @brief Деактивировать кошелёк каскадом (протокол B)
     *
     * @throws NotFoundError если кошелька нет
     * @throws AlreadyDeactivatedError если кошелёк уже неактивен
     */
    Wallet deactivateWallet(const WalletId& id);

    /**
     * @brief Записать транзакцию и новый баланс (протокол A)
     */
    TransactionResult applyTransaction(const Wallet& wallet, const Transaction& transaction);

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
};

} // namespace ledger::domain::services
