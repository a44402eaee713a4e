#pragma once

#include "ICommandHandler.hpp"
#include "JsonMapper.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary {

/**
 * @brief ledger wallet rename <wallet_id> <label>
 */
class RenameWalletHandler : public ICommandHandler {
public:
    explicit RenameWalletHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
        : ledgerService_(std::move(ledgerService)) {}

    CommandResponse handle(const CommandRequest& req) override {
        auto id = domain::WalletId::parse(req.arg(0, "wallet_id"));
        auto wallet = ledgerService_->updateWalletLabel(id, req.arg(1, "label"));
        return CommandResponse{200, toJson(wallet)};
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
};

} // namespace ledger::adapters::primary
