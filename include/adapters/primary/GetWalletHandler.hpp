#pragma once

#include "ICommandHandler.hpp"
#include "JsonMapper.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary {

/**
 * @brief ledger wallet get <wallet_id>
 *
 * Только активный кошелёк, без транзакций.
 */
class GetWalletHandler : public ICommandHandler {
public:
    explicit GetWalletHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
        : ledgerService_(std::move(ledgerService)) {}

    CommandResponse handle(const CommandRequest& req) override {
        auto id = domain::WalletId::parse(req.arg(0, "wallet_id"));
        return CommandResponse{200, toJson(ledgerService_->getWallet(id))};
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
};

} // namespace ledger::adapters::primary
