#pragma once

#include "ICommandHandler.hpp"
#include "JsonMapper.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary {

/**
 * @brief ledger wallet deactivate <wallet_id>
 *
 * Ответ содержит кошелёк и транзакции, деактивированные каскадом.
 */
class DeactivateWalletHandler : public ICommandHandler {
public:
    explicit DeactivateWalletHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
        : ledgerService_(std::move(ledgerService)) {}

    CommandResponse handle(const CommandRequest& req) override {
        auto id = domain::WalletId::parse(req.arg(0, "wallet_id"));
        auto wallet = ledgerService_->deactivateWallet(id);
        return CommandResponse{200, toJson(wallet, true)};
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
};

} // namespace ledger::adapters::primary
