#pragma once

#include "ICommandHandler.hpp"
#include "JsonMapper.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary {

/**
 * @brief ledger tx create <wallet_id> --amount=<signed integer>
 *
 * Положительную сумму можно передать вторым аргументом,
 * отрицательную только через --amount=-N.
 */
class CreateTransactionHandler : public ICommandHandler {
public:
    explicit CreateTransactionHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
        : ledgerService_(std::move(ledgerService)) {}

    CommandResponse handle(const CommandRequest& req) override {
        auto walletId = domain::WalletId::parse(req.arg(0, "wallet_id"));

        auto rawAmount = req.option("amount");
        auto amount = domain::Money::parse(rawAmount ? *rawAmount : req.arg(1, "amount"));

        auto result = ledgerService_->createTransaction(walletId, amount);
        return CommandResponse{201, toJson(result)};
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
};

} // namespace ledger::adapters::primary
