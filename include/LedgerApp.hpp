#pragma once

// Ports
#include "ports/input/ILedgerService.hpp"
#include "ports/output/ILedgerStore.hpp"

// Domain services & Application
#include "domain/services/TransactionDomainService.hpp"
#include "domain/services/WalletDomainService.hpp"
#include "application/LedgerOrchestrationService.hpp"
#include "application/LedgerService.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "adapters/secondary/PostgresLedgerStore.hpp"
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

// Primary Adapters
#include "adapters/primary/CommandRouter.hpp"
#include "adapters/primary/CreateWalletHandler.hpp"
#include "adapters/primary/GetWalletHandler.hpp"
#include "adapters/primary/ShowWalletHandler.hpp"
#include "adapters/primary/RenameWalletHandler.hpp"
#include "adapters/primary/DeactivateWalletHandler.hpp"
#include "adapters/primary/ListWalletsHandler.hpp"
#include "adapters/primary/CreateTransactionHandler.hpp"
#include "adapters/primary/GetTransactionHandler.hpp"
#include "adapters/primary/ListTransactionsHandler.hpp"

#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace ledger {

namespace po = boost::program_options;

/**
 * @brief Ledger CLI Application
 *
 * Template Method:
 * 1. loadEnvironment() - аргументы командной строки и настройки из ENV
 * 2. configureInjection() - явная сборка: store -> domain services -> orchestration -> handlers
 * 3. start() - выполнение одной команды, JSON в out
 *
 * Код возврата: 0 при успехе, 1 при ошибке.
 */
class LedgerApp {
public:
    explicit LedgerApp(std::ostream& out) : out_(out) {}

    int run(int argc, char* argv[]) {
        if (!loadEnvironment(argc, argv)) {
            return exitCode_;
        }
        configureInjection();
        return start();
    }

protected:
    bool loadEnvironment(int argc, char* argv[]) {
        po::options_description desc("Allowed options");
        desc.add_options()
            ("help,h", "produce this message")
            ("active", po::value<std::string>(), "filter by active flag: true | false")
            ("ids", po::value<std::string>(), "comma-separated wallet ids (wallet list)")
            ("wallets", po::value<std::string>(), "comma-separated wallet ids (tx list)")
            ("page", po::value<std::string>(), "page number, from 1")
            ("page-size", po::value<std::string>(), "page size")
            ("sort", po::value<std::string>(), "sort key, '-' prefix for descending")
            ("amount", po::value<std::string>(), "signed transaction amount, e.g. --amount=-60");

        po::options_description hidden;
        hidden.add_options()
            ("group", po::value<std::string>())
            ("command", po::value<std::string>())
            ("args", po::value<std::vector<std::string>>());

        po::options_description all;
        all.add(desc).add(hidden);

        po::positional_options_description positional;
        positional.add("group", 1).add("command", 1).add("args", -1);

        po::variables_map vm;
        try {
            po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
            po::notify(vm);
        } catch (const po::error& e) {
            std::cerr << "[LedgerApp] " << e.what() << std::endl;
            printUsage(std::cerr, desc);
            exitCode_ = 1;
            return false;
        }

        if (vm.count("help") > 0 || vm.count("group") == 0 || vm.count("command") == 0) {
            printUsage(vm.count("help") > 0 ? out_ : std::cerr, desc);
            exitCode_ = vm.count("help") > 0 ? 0 : 1;
            return false;
        }

        group_ = vm["group"].as<std::string>();
        command_ = vm["command"].as<std::string>();
        if (vm.count("args") > 0) {
            request_.args = vm["args"].as<std::vector<std::string>>();
        }
        for (const char* name : {"active", "ids", "wallets", "page", "page-size", "sort", "amount"}) {
            if (vm.count(name) > 0) {
                request_.options[name] = vm[name].as<std::string>();
            }
        }

        settings_ = std::make_shared<settings::LedgerSettings>();
        std::cout << "[LedgerApp] Environment loaded, storage="
                  << settings::toString(settings_->getStorage()) << std::endl;
        return true;
    }

    void configureInjection() {
        std::cout << "[LedgerApp] Wiring components..." << std::endl;

        // ====================================================================
        // Layer 1: Secondary Adapters
        // ====================================================================
        std::shared_ptr<ports::output::ILedgerStore> store;
        if (settings_->getStorage() == settings::StorageBackend::MEMORY) {
            store = std::make_shared<adapters::secondary::InMemoryLedgerStore>(settings_);
        } else {
            auto dbSettings = std::make_shared<settings::DbSettings>();
            store = std::make_shared<adapters::secondary::PostgresLedgerStore>(dbSettings, settings_);
        }

        // ====================================================================
        // Layer 2: Domain Services & Application
        // ====================================================================
        auto walletService = std::make_shared<domain::services::WalletDomainService>(store);
        auto transactionService = std::make_shared<domain::services::TransactionDomainService>(store, settings_);
        auto orchestration = std::make_shared<application::LedgerOrchestrationService>(
            walletService, transactionService);
        std::shared_ptr<ports::input::ILedgerService> ledgerService =
            std::make_shared<application::LedgerService>(walletService, transactionService, orchestration, settings_);

        // ====================================================================
        // Layer 3: Primary Adapters (CLI commands)
        // ====================================================================
        router_.registerCommand("wallet", "create", std::make_shared<adapters::primary::CreateWalletHandler>(ledgerService));
        router_.registerCommand("wallet", "get", std::make_shared<adapters::primary::GetWalletHandler>(ledgerService));
        router_.registerCommand("wallet", "show", std::make_shared<adapters::primary::ShowWalletHandler>(ledgerService));
        router_.registerCommand("wallet", "rename", std::make_shared<adapters::primary::RenameWalletHandler>(ledgerService));
        router_.registerCommand("wallet", "deactivate", std::make_shared<adapters::primary::DeactivateWalletHandler>(ledgerService));
        router_.registerCommand("wallet", "list", std::make_shared<adapters::primary::ListWalletsHandler>(ledgerService));
        router_.registerCommand("tx", "create", std::make_shared<adapters::primary::CreateTransactionHandler>(ledgerService));
        router_.registerCommand("tx", "get", std::make_shared<adapters::primary::GetTransactionHandler>(ledgerService));
        router_.registerCommand("tx", "list", std::make_shared<adapters::primary::ListTransactionsHandler>(ledgerService));

        std::cout << "[LedgerApp] 9 commands registered" << std::endl;
    }

    int start() {
        auto response = router_.dispatch(group_, command_, request_);
        response.body["status"] = response.status;
        out_ << response.body.dump(2) << std::endl;
        return response.ok() ? 0 : 1;
    }

private:
    std::ostream& out_;
    int exitCode_ = 0;

    std::shared_ptr<settings::LedgerSettings> settings_;
    adapters::primary::CommandRouter router_;

    std::string group_;
    std::string command_;
    adapters::primary::CommandRequest request_;

    static void printUsage(std::ostream& os, const po::options_description& desc) {
        os << "Usage: ledger <wallet|tx> <command> [args] [options]\n"
           << "  wallet create <label>\n"
           << "  wallet get <wallet_id>\n"
           << "  wallet show <wallet_id>\n"
           << "  wallet rename <wallet_id> <label>\n"
           << "  wallet deactivate <wallet_id>\n"
           << "  wallet list [--active] [--ids] [--page] [--page-size] [--sort]\n"
           << "  tx create <wallet_id> --amount=<amount>\n"
           << "  tx get <txid>\n"
           << "  tx list [--active] [--wallets] [--page] [--page-size] [--sort]\n\n"
           << desc << std::endl;
    }
};

} // namespace ledger
