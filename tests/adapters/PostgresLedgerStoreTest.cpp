#include <gtest/gtest.h>

#include "adapters/secondary/PostgresLedgerStore.hpp"
#include "domain/errors/LedgerError.hpp"
#include "mocks/TestSettings.hpp"
#include <atomic>
#include <cstdlib>
#include <thread>

using namespace ledger;
using namespace ledger::domain;
using ledger::adapters::secondary::PostgresLedgerStore;

/**
 * Интеграционные тесты против живой БД.
 * Запуск: LEDGER_TEST_DB_URL="host=localhost dbname=ledger_test user=... password=..."
 */
class PostgresLedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* url = std::getenv("LEDGER_TEST_DB_URL");
        if (!url) {
            GTEST_SKIP() << "LEDGER_TEST_DB_URL not set";
        }

        auto dbSettings = std::make_shared<settings::DbSettings>(url);
        store_ = std::make_shared<PostgresLedgerStore>(dbSettings, tests::mocks::makeTestSettings(2000));
        store_->truncate();
    }

    Wallet createWallet(const std::string& label = "Alice") {
        return store_->insertWallet(Wallet::create(WalletId::generate(), label));
    }

    Transaction makeTransaction(const Wallet& wallet, int64_t amount) {
        return Transaction::create(TransactionId::generate(), wallet.id(),
                                   TxId("tx_pg_" + TransactionId::generate().value()), Money(amount));
    }

    std::shared_ptr<PostgresLedgerStore> store_;
};

TEST_F(PostgresLedgerStoreTest, Wallet_RoundTrip) {
    auto wallet = createWallet();

    auto found = store_->findWalletById(wallet.id());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->label(), wallet.label());
    EXPECT_EQ(found->balance(), wallet.balance());
    EXPECT_EQ(found->isActive(), wallet.isActive());
    EXPECT_EQ(found->createdAt(), wallet.createdAt());
    EXPECT_EQ(found->updatedAt(), wallet.updatedAt());
}

TEST_F(PostgresLedgerStoreTest, UpdateWalletLabel_DeactivatedWalletRejected) {
    auto wallet = createWallet();
    auto renamed = wallet;
    renamed.updateLabel("Bob");
    EXPECT_EQ(store_->updateWalletLabel(renamed).label(), "Bob");

    store_->deactivateWalletWithTransactions(wallet.id());
    renamed.updateLabel("Carol");
    EXPECT_THROW(store_->updateWalletLabel(renamed), AlreadyDeactivatedError);
    EXPECT_EQ(store_->findWalletById(wallet.id())->label(), "Bob");

    auto ghost = Wallet::create(WalletId::generate(), "Ghost");
    EXPECT_THROW(store_->updateWalletLabel(ghost), NotFoundError);
}

TEST_F(PostgresLedgerStoreTest, ProtocolA_CommitAndReject) {
    auto wallet = createWallet();

    auto result = store_->createTransactionWithBalanceUpdate(wallet, makeTransaction(wallet, 1000));
    EXPECT_EQ(result.wallet.balance(), Money(1000));

    auto stored = store_->findTransactionByTxid(result.transaction.txid());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->createdAt(), result.transaction.createdAt());
    EXPECT_EQ(stored->amount(), Money(1000));

    auto overdraft = makeTransaction(wallet, -1500);
    EXPECT_THROW(store_->createTransactionWithBalanceUpdate(wallet, overdraft), InsufficientBalanceError);
    EXPECT_FALSE(store_->transactionExistsByTxid(overdraft.txid()));
    EXPECT_EQ(store_->findWalletById(wallet.id())->balance(), Money(1000));
}

TEST_F(PostgresLedgerStoreTest, ProtocolA_DuplicateTxidConflict) {
    auto wallet = createWallet();
    auto first = makeTransaction(wallet, 10);
    store_->createTransactionWithBalanceUpdate(wallet, first);

    auto duplicate = Transaction::create(TransactionId::generate(), wallet.id(), first.txid(), Money(5));
    EXPECT_THROW(store_->createTransactionWithBalanceUpdate(wallet, duplicate), ConflictError);
    EXPECT_EQ(store_->findWalletById(wallet.id())->balance(), Money(10));
}

TEST_F(PostgresLedgerStoreTest, ProtocolA_ConcurrentDebitsExactlyOneWins) {
    auto wallet = createWallet();
    store_->createTransactionWithBalanceUpdate(wallet, makeTransaction(wallet, 100));

    auto tx1 = makeTransaction(wallet, -60);
    auto tx2 = makeTransaction(wallet, -60);
    std::atomic<int> insufficient{0};

    auto debit = [&](const Transaction& tx) {
        try {
            store_->createTransactionWithBalanceUpdate(wallet, tx);
        } catch (const InsufficientBalanceError&) {
            ++insufficient;
        }
    };
    std::thread t1(debit, std::cref(tx1));
    std::thread t2(debit, std::cref(tx2));
    t1.join();
    t2.join();

    EXPECT_EQ(insufficient.load(), 1);
    EXPECT_EQ(store_->findWalletById(wallet.id())->balance(), Money(40));
}

TEST_F(PostgresLedgerStoreTest, ProtocolB_Cascade) {
    auto wallet = createWallet();
    store_->createTransactionWithBalanceUpdate(wallet, makeTransaction(wallet, 500));
    store_->createTransactionWithBalanceUpdate(wallet, makeTransaction(wallet, -200));

    auto deactivated = store_->deactivateWalletWithTransactions(wallet.id());

    EXPECT_FALSE(deactivated.isActive());
    EXPECT_TRUE(deactivated.balance().isZero());
    EXPECT_EQ(deactivated.transactions().size(), 2u);
    EXPECT_TRUE(store_->findActiveTransactionsByWalletId(wallet.id()).empty());
    EXPECT_THROW(store_->deactivateWalletWithTransactions(wallet.id()), AlreadyDeactivatedError);
}

TEST_F(PostgresLedgerStoreTest, ListWallets_FilterSortPage) {
    auto a = createWallet("A");
    auto b = createWallet("B");
    createWallet("C");
    store_->createTransactionWithBalanceUpdate(b, makeTransaction(b, 9));
    store_->deactivateWalletWithTransactions(a.id());

    auto active = store_->listWallets(WalletFilter{true, {}}, PageRequest{1, 10, std::nullopt});
    ASSERT_EQ(active.count, 2);
    EXPECT_EQ(active.items[0].id(), b.id());

    auto byIds = store_->listWallets(WalletFilter{std::nullopt, {a.id(), b.id()}},
                                     PageRequest{5, 1, std::string("label")});
    EXPECT_EQ(byIds.count, 2);
    EXPECT_EQ(byIds.page, 2);
    ASSERT_EQ(byIds.items.size(), 1u);
    EXPECT_EQ(byIds.items[0].label(), "B");
}
