#pragma once

#include "ports/output/ILedgerStore.hpp"
#include <gmock/gmock.h>

namespace ledger::tests::mocks {

/**
 * @brief gMock хранилища для тестов доменных сервисов
 */
class MockLedgerStore : public ports::output::ILedgerStore {
public:
    MOCK_METHOD(domain::Wallet, insertWallet, (const domain::Wallet&), (override));
    MOCK_METHOD(domain::Wallet, updateWalletLabel, (const domain::Wallet&), (override));
    MOCK_METHOD(std::optional<domain::Wallet>, findWalletById, (const domain::WalletId&), (override));
    MOCK_METHOD(std::optional<domain::Wallet>, findActiveWalletById, (const domain::WalletId&), (override));
    MOCK_METHOD(bool, walletExists, (const domain::WalletId&), (override));
    MOCK_METHOD(std::vector<domain::Wallet>, findWalletsByIds, (const std::vector<domain::WalletId>&), (override));
    MOCK_METHOD(domain::Page<domain::Wallet>, listWallets,
                (const domain::WalletFilter&, const domain::PageRequest&), (override));

    MOCK_METHOD(std::optional<domain::Transaction>, findTransactionById, (const domain::TransactionId&), (override));
    MOCK_METHOD(std::optional<domain::Transaction>, findTransactionByTxid, (const domain::TxId&), (override));
    MOCK_METHOD(std::optional<domain::Transaction>, findActiveTransactionByTxid, (const domain::TxId&), (override));
    MOCK_METHOD(bool, transactionExistsByTxid, (const domain::TxId&), (override));
    MOCK_METHOD(std::vector<domain::Transaction>, findActiveTransactionsByWalletId,
                (const domain::WalletId&), (override));
    MOCK_METHOD(std::vector<domain::Transaction>, findActiveTransactionsByWalletIds,
                (const std::vector<domain::WalletId>&), (override));
    MOCK_METHOD(domain::Page<domain::Transaction>, listTransactions,
                (const domain::TransactionFilter&, const domain::PageRequest&), (override));

    MOCK_METHOD(domain::TransactionResult, createTransactionWithBalanceUpdate,
                (const domain::Wallet&, const domain::Transaction&), (override));
    MOCK_METHOD(domain::Wallet, deactivateWalletWithTransactions, (const domain::WalletId&), (override));
};

} // namespace ledger::tests::mocks
