#pragma once

#include "ICommandHandler.hpp"
#include "JsonMapper.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary {

/**
 * @brief ledger wallet show <wallet_id>
 *
 * Кошелёк вместе с активными транзакциями.
 */
class ShowWalletHandler : public ICommandHandler {
public:
    explicit ShowWalletHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
        : ledgerService_(std::move(ledgerService)) {}

    CommandResponse handle(const CommandRequest& req) override {
        auto id = domain::WalletId::parse(req.arg(0, "wallet_id"));
        auto wallet = ledgerService_->getWalletWithTransactions(id);
        return CommandResponse{200, toJson(wallet, true)};
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
};

} // namespace ledger::adapters::primary
