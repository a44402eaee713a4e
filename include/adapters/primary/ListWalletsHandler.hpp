#pragma once

#include "CommandOptions.hpp"
#include "ICommandHandler.hpp"
#include "JsonMapper.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary {

/**
 * @brief ledger wallet list [--active=true|false] [--ids=a,b] [--page=N] [--page-size=N] [--sort=-balance]
 */
class ListWalletsHandler : public ICommandHandler {
public:
    explicit ListWalletsHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
        : ledgerService_(std::move(ledgerService)) {}

    CommandResponse handle(const CommandRequest& req) override {
        domain::WalletFilter filter;
        filter.isActive = parseActiveFlag(req);
        filter.walletIds = parseWalletIds(req.option("ids"));

        auto page = ledgerService_->listWallets(filter, parsePageQuery(req));
        return CommandResponse{200, toJson(page)};
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
};

} // namespace ledger::adapters::primary
