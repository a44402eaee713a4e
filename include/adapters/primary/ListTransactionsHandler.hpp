#pragma once

#include "CommandOptions.hpp"
#include "ICommandHandler.hpp"
#include "JsonMapper.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary {

/**
 * @brief ledger tx list [--active=true|false] [--wallets=a,b] [--page=N] [--page-size=N] [--sort=-created_at]
 */
class ListTransactionsHandler : public ICommandHandler {
public:
    explicit ListTransactionsHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
        : ledgerService_(std::move(ledgerService)) {}

    CommandResponse handle(const CommandRequest& req) override {
        domain::TransactionFilter filter;
        filter.isActive = parseActiveFlag(req);
        filter.walletIds = parseWalletIds(req.option("wallets"));

        auto page = ledgerService_->listTransactions(filter, parsePageQuery(req));
        return CommandResponse{200, toJson(page)};
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
};

} // namespace ledger::adapters::primary
