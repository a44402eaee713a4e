#pragma once

#include "ICommandHandler.hpp"
#include "JsonMapper.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary {

/**
 * @brief ledger wallet create <label>
 */
class CreateWalletHandler : public ICommandHandler {
public:
    explicit CreateWalletHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
        : ledgerService_(std::move(ledgerService)) {}

    CommandResponse handle(const CommandRequest& req) override {
        auto wallet = ledgerService_->createWallet(req.arg(0, "label"));
        return CommandResponse{201, toJson(wallet)};
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
};

} // namespace ledger::adapters::primary
