#pragma once

#include "ICommandHandler.hpp"
#include "JsonMapper.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary {

/**
 * @brief ledger tx get <txid>
 */
class GetTransactionHandler : public ICommandHandler {
public:
    explicit GetTransactionHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
        : ledgerService_(std::move(ledgerService)) {}

    CommandResponse handle(const CommandRequest& req) override {
        domain::TxId txid(req.arg(0, "txid"));
        return CommandResponse{200, toJson(ledgerService_->getTransactionByTxid(txid))};
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
};

} // namespace ledger::adapters::primary
