#include <gtest/gtest.h>

#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "domain/errors/LedgerError.hpp"
#include "mocks/TestSettings.hpp"
#include <atomic>
#include <latch>
#include <thread>

using namespace ledger;
using namespace ledger::domain;
using ledger::adapters::secondary::InMemoryLedgerStore;

class InMemoryLedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryLedgerStore>(tests::mocks::makeTestSettings(2000));
    }

    void TearDown() override {
        store_->clear();
    }

    Wallet createWallet(const std::string& label = "Alice") {
        return store_->insertWallet(Wallet::create(WalletId::generate(), label));
    }

    Transaction makeTransaction(const Wallet& wallet, int64_t amount) {
        return Transaction::create(TransactionId::generate(), wallet.id(),
                                   TxId("tx_test_" + std::to_string(++counter_)), Money(amount));
    }

    TransactionResult apply(const Wallet& wallet, int64_t amount) {
        return store_->createTransactionWithBalanceUpdate(wallet, makeTransaction(wallet, amount));
    }

    Money activeSum(const WalletId& id) {
        Money total;
        for (const auto& tx : store_->findActiveTransactionsByWalletId(id)) {
            total += tx.amount();
        }
        return total;
    }

    std::shared_ptr<InMemoryLedgerStore> store_;
    int counter_ = 0;
};

// ============================================
// WALLET CRUD TESTS
// ============================================

TEST_F(InMemoryLedgerStoreTest, InsertWallet_RoundTrip) {
    auto wallet = createWallet();

    auto found = store_->findWalletById(wallet.id());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->label(), "Alice");
    EXPECT_TRUE(found->balance().isZero());
    EXPECT_TRUE(found->isActive());
    EXPECT_EQ(found->createdAt(), wallet.createdAt());
    EXPECT_EQ(found->updatedAt(), wallet.updatedAt());
    EXPECT_TRUE(store_->walletExists(wallet.id()));
}

TEST_F(InMemoryLedgerStoreTest, InsertWallet_DuplicateIdConflict) {
    auto wallet = createWallet();
    EXPECT_THROW(store_->insertWallet(wallet), ConflictError);
}

TEST_F(InMemoryLedgerStoreTest, UpdateWalletLabel_KeepsBalance) {
    auto wallet = createWallet();
    apply(wallet, 100);

    auto renamed = wallet;
    renamed.updateLabel("Bob");
    auto saved = store_->updateWalletLabel(renamed);

    EXPECT_EQ(saved.label(), "Bob");
    EXPECT_EQ(saved.balance(), Money(100));
}

TEST_F(InMemoryLedgerStoreTest, UpdateWalletLabel_MissingWallet) {
    auto ghost = Wallet::create(WalletId::generate(), "Ghost");
    EXPECT_THROW(store_->updateWalletLabel(ghost), NotFoundError);
}

TEST_F(InMemoryLedgerStoreTest, UpdateWalletLabel_DeactivatedWalletRejected) {
    auto wallet = createWallet();
    store_->deactivateWalletWithTransactions(wallet.id());

    auto renamed = wallet;
    renamed.updateLabel("Bob");
    EXPECT_THROW(store_->updateWalletLabel(renamed), AlreadyDeactivatedError);
    EXPECT_EQ(store_->findWalletById(wallet.id())->label(), "Alice");
}

TEST_F(InMemoryLedgerStoreTest, UpdateWalletLabel_WaitsForRowLock) {
    auto store = std::make_shared<InMemoryLedgerStore>(tests::mocks::makeTestSettings(50));
    auto wallet = store->insertWallet(Wallet::create(WalletId::generate(), "Busy"));
    auto renamed = wallet;
    renamed.updateLabel("Renamed");

    auto held = store->lockWalletRow(wallet.id());

    std::atomic<bool> timedOut{false};
    std::thread contender([&]() {
        try {
            store->updateWalletLabel(renamed);
        } catch (const LockTimeoutError&) {
            timedOut = true;
        }
    });
    contender.join();

    EXPECT_TRUE(timedOut.load());
    EXPECT_EQ(store->findWalletById(wallet.id())->label(), "Busy");

    held.unlock();
    EXPECT_EQ(store->updateWalletLabel(renamed).label(), "Renamed");
}

TEST_F(InMemoryLedgerStoreTest, UpdateWalletLabel_SurvivesConcurrentProtocolA) {
    for (int round = 0; round < 50; ++round) {
        auto wallet = createWallet();
        auto renamed = wallet;
        renamed.updateLabel("Bob");

        std::latch start(2);
        std::thread writer([&]() {
            start.arrive_and_wait();
            apply(wallet, 10);
        });
        std::thread renamer([&]() {
            start.arrive_and_wait();
            store_->updateWalletLabel(renamed);
        });
        writer.join();
        renamer.join();

        auto after = store_->findWalletById(wallet.id());
        EXPECT_EQ(after->label(), "Bob");
        EXPECT_EQ(after->balance(), Money(10));
    }
}

TEST_F(InMemoryLedgerStoreTest, UpdateWalletLabel_RacingProtocolBIsKeptOrRejected) {
    for (int round = 0; round < 50; ++round) {
        auto wallet = createWallet();
        apply(wallet, 40);
        auto renamed = wallet;
        renamed.updateLabel("Bob");

        std::latch start(2);
        std::atomic<bool> renameRejected{false};
        std::thread renamer([&]() {
            start.arrive_and_wait();
            try {
                store_->updateWalletLabel(renamed);
            } catch (const AlreadyDeactivatedError&) {
                renameRejected = true;
            }
        });
        std::thread deactivator([&]() {
            start.arrive_and_wait();
            store_->deactivateWalletWithTransactions(wallet.id());
        });
        renamer.join();
        deactivator.join();

        auto after = store_->findWalletById(wallet.id());
        EXPECT_FALSE(after->isActive());
        EXPECT_TRUE(after->balance().isZero());
        EXPECT_EQ(after->label(), renameRejected.load() ? "Alice" : "Bob");
    }
}

TEST_F(InMemoryLedgerStoreTest, FindWalletsByIds_SkipsUnknown) {
    auto a = createWallet("A");
    auto b = createWallet("B");

    auto found = store_->findWalletsByIds({a.id(), WalletId::generate(), b.id(), a.id()});
    EXPECT_EQ(found.size(), 2u);
}

// ============================================
// PROTOCOL A TESTS
// ============================================

TEST_F(InMemoryLedgerStoreTest, ProtocolA_CreditUpdatesBalance) {
    auto wallet = createWallet();

    auto result = apply(wallet, 1000);

    EXPECT_EQ(result.wallet.balance(), Money(1000));
    EXPECT_TRUE(result.transaction.isActive());
    EXPECT_EQ(result.wallet.transactions().size(), 1u);
    EXPECT_EQ(store_->findWalletById(wallet.id())->balance(), Money(1000));
    EXPECT_TRUE(store_->transactionExistsByTxid(result.transaction.txid()));
}

TEST_F(InMemoryLedgerStoreTest, ProtocolA_IgnoresStaleInMemoryBalance) {
    auto stale = createWallet();
    apply(stale, 100);

    // stale всё ещё несёт баланс 0, хранилище должно прочитать 100
    auto result = apply(stale, -60);
    EXPECT_EQ(result.wallet.balance(), Money(40));
}

TEST_F(InMemoryLedgerStoreTest, ProtocolA_InsufficientBalanceWritesNothing) {
    auto wallet = createWallet();
    apply(wallet, 1000);
    auto tx = makeTransaction(wallet, -1500);

    try {
        store_->createTransactionWithBalanceUpdate(wallet, tx);
        FAIL() << "expected InsufficientBalanceError";
    } catch (const InsufficientBalanceError& e) {
        EXPECT_EQ(e.current(), Money(1000));
        EXPECT_EQ(e.delta(), Money(-1500));
        EXPECT_EQ(e.resulting(), Money(-500));
    }

    EXPECT_EQ(store_->findWalletById(wallet.id())->balance(), Money(1000));
    EXPECT_FALSE(store_->transactionExistsByTxid(tx.txid()));
    EXPECT_EQ(store_->transactionCount(), 1u);
}

TEST_F(InMemoryLedgerStoreTest, ProtocolA_ExactDebitToZeroAllowed) {
    auto wallet = createWallet();
    apply(wallet, 50);

    auto result = apply(wallet, -50);
    EXPECT_TRUE(result.wallet.balance().isZero());
}

TEST_F(InMemoryLedgerStoreTest, ProtocolA_UnknownWalletNotFound) {
    auto ghost = Wallet::create(WalletId::generate(), "Ghost");
    EXPECT_THROW(apply(ghost, 10), NotFoundError);
}

TEST_F(InMemoryLedgerStoreTest, ProtocolA_WalletDeactivatedAfterFetch) {
    auto wallet = createWallet();
    store_->deactivateWalletWithTransactions(wallet.id());

    EXPECT_THROW(apply(wallet, 10), AlreadyDeactivatedError);
}

TEST_F(InMemoryLedgerStoreTest, ProtocolA_DuplicateTxidConflict) {
    auto wallet = createWallet();
    apply(wallet, 10);

    auto duplicate = Transaction::create(TransactionId::generate(), wallet.id(), TxId("tx_test_1"), Money(5));
    EXPECT_THROW(store_->createTransactionWithBalanceUpdate(wallet, duplicate), ConflictError);
    EXPECT_EQ(store_->findWalletById(wallet.id())->balance(), Money(10));
}

TEST_F(InMemoryLedgerStoreTest, ProtocolA_ForeignTransactionRejected) {
    auto wallet = createWallet();
    auto other = createWallet("Bob");

    EXPECT_THROW(store_->createTransactionWithBalanceUpdate(wallet, makeTransaction(other, 10)), ValidationError);
}

// ============================================
// CONCURRENCY TESTS
// ============================================

TEST_F(InMemoryLedgerStoreTest, ProtocolA_ConcurrentDebitsExactlyOneWins) {
    for (int round = 0; round < 50; ++round) {
        auto wallet = createWallet();
        apply(wallet, 100);

        std::atomic<int> succeeded{0};
        std::atomic<int> insufficient{0};
        std::latch start(2);

        // makeTransaction трогает counter_, поэтому транзакции строятся до старта потоков
        auto tx1 = makeTransaction(wallet, -60);
        auto tx2 = makeTransaction(wallet, -60);
        std::thread t1([&]() {
            start.arrive_and_wait();
            try { store_->createTransactionWithBalanceUpdate(wallet, tx1); ++succeeded; }
            catch (const InsufficientBalanceError&) { ++insufficient; }
        });
        std::thread t2([&]() {
            start.arrive_and_wait();
            try { store_->createTransactionWithBalanceUpdate(wallet, tx2); ++succeeded; }
            catch (const InsufficientBalanceError&) { ++insufficient; }
        });
        t1.join();
        t2.join();

        EXPECT_EQ(succeeded.load(), 1);
        EXPECT_EQ(insufficient.load(), 1);
        auto balance = store_->findWalletById(wallet.id())->balance();
        EXPECT_EQ(balance, Money(40));
        EXPECT_EQ(balance, activeSum(wallet.id()));
    }
}

TEST_F(InMemoryLedgerStoreTest, ProtocolA_ManyConcurrentCreditsAllCounted) {
    auto wallet = createWallet();
    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;

    std::vector<std::vector<Transaction>> batches(kThreads);
    for (auto& batch : batches) {
        for (int i = 0; i < kPerThread; ++i) {
            batch.push_back(makeTransaction(wallet, 2));
        }
    }

    std::vector<std::thread> threads;
    for (size_t i = 0; i < batches.size(); ++i) {
        threads.emplace_back([&, i]() {
            for (const auto& tx : batches[i]) {
                store_->createTransactionWithBalanceUpdate(wallet, tx);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(store_->findWalletById(wallet.id())->balance(), Money(2 * kThreads * kPerThread));
    EXPECT_EQ(activeSum(wallet.id()), Money(2 * kThreads * kPerThread));
}

TEST_F(InMemoryLedgerStoreTest, LockTimeout_WhenRowHeldElsewhere) {
    auto store = std::make_shared<InMemoryLedgerStore>(tests::mocks::makeTestSettings(50));
    auto wallet = store->insertWallet(Wallet::create(WalletId::generate(), "Busy"));

    auto held = store->lockWalletRow(wallet.id());

    std::atomic<bool> timedOut{false};
    std::atomic<bool> retryable{false};
    std::thread contender([&]() {
        try {
            store->createTransactionWithBalanceUpdate(wallet, makeTransaction(wallet, 10));
        } catch (const LockTimeoutError& e) {
            timedOut = true;
            retryable = e.retryable();
        }
    });
    contender.join();

    EXPECT_TRUE(timedOut.load());
    EXPECT_TRUE(retryable.load());
    EXPECT_TRUE(store->findWalletById(wallet.id())->balance().isZero());

    held.unlock();
    EXPECT_NO_THROW(store->createTransactionWithBalanceUpdate(wallet, makeTransaction(wallet, 10)));
}

TEST_F(InMemoryLedgerStoreTest, LockIsPerWallet) {
    auto store = std::make_shared<InMemoryLedgerStore>(tests::mocks::makeTestSettings(50));
    auto busy = store->insertWallet(Wallet::create(WalletId::generate(), "Busy"));
    auto free = store->insertWallet(Wallet::create(WalletId::generate(), "Free"));

    auto held = store->lockWalletRow(busy.id());

    std::atomic<bool> ok{false};
    std::thread other([&]() {
        store->createTransactionWithBalanceUpdate(free, makeTransaction(free, 10));
        ok = true;
    });
    other.join();

    EXPECT_TRUE(ok.load());
}

// ============================================
// PROTOCOL B TESTS
// ============================================

TEST_F(InMemoryLedgerStoreTest, ProtocolB_CascadeBringsBalanceToZero) {
    auto wallet = createWallet();
    apply(wallet, 500);
    apply(wallet, -200);
    apply(wallet, 50);

    auto deactivated = store_->deactivateWalletWithTransactions(wallet.id());

    EXPECT_FALSE(deactivated.isActive());
    EXPECT_TRUE(deactivated.balance().isZero());
    ASSERT_TRUE(deactivated.deactivatedAt().has_value());
    EXPECT_EQ(deactivated.transactions().size(), 3u);
    for (const auto& tx : deactivated.transactions()) {
        EXPECT_FALSE(tx.isActive());
        EXPECT_TRUE(tx.deactivatedAt().has_value());
    }

    EXPECT_TRUE(store_->findActiveTransactionsByWalletId(wallet.id()).empty());
    EXPECT_FALSE(store_->findActiveWalletById(wallet.id()).has_value());
    EXPECT_FALSE(store_->findActiveTransactionByTxid(deactivated.transactions()[0].txid()).has_value());
    EXPECT_TRUE(store_->findTransactionByTxid(deactivated.transactions()[0].txid()).has_value());
}

TEST_F(InMemoryLedgerStoreTest, ProtocolB_TwiceAlreadyDeactivated) {
    auto wallet = createWallet();
    store_->deactivateWalletWithTransactions(wallet.id());

    EXPECT_THROW(store_->deactivateWalletWithTransactions(wallet.id()), AlreadyDeactivatedError);
}

TEST_F(InMemoryLedgerStoreTest, ProtocolB_UnknownWalletNotFound) {
    EXPECT_THROW(store_->deactivateWalletWithTransactions(WalletId::generate()), NotFoundError);
}

TEST_F(InMemoryLedgerStoreTest, ProtocolB_OtherWalletsUntouched) {
    auto a = createWallet("A");
    auto b = createWallet("B");
    apply(a, 10);
    apply(b, 20);

    store_->deactivateWalletWithTransactions(a.id());

    EXPECT_EQ(store_->findWalletById(b.id())->balance(), Money(20));
    EXPECT_EQ(store_->findActiveTransactionsByWalletId(b.id()).size(), 1u);
}

TEST_F(InMemoryLedgerStoreTest, ProtocolB_ReadersNeverSeePartialCascade) {
    auto wallet = createWallet();
    for (int i = 0; i < 30; ++i) {
        apply(wallet, 1);
    }

    std::atomic<bool> done{false};
    std::atomic<int> violations{0};
    std::thread reader([&]() {
        while (!done.load()) {
            auto txs = store_->listTransactions(TransactionFilter{std::nullopt, {wallet.id()}}, PageRequest{1, 100, std::nullopt});
            int active = 0;
            for (const auto& tx : txs.items) {
                if (tx.isActive()) ++active;
            }
            if (active != 0 && active != 30) {
                ++violations;
            }
        }
    });

    store_->deactivateWalletWithTransactions(wallet.id());
    done = true;
    reader.join();

    EXPECT_EQ(violations.load(), 0);
}

TEST_F(InMemoryLedgerStoreTest, ProtocolB_RacingCreditIsEitherCascadedOrRejected) {
    for (int round = 0; round < 30; ++round) {
        auto wallet = createWallet();
        apply(wallet, 100);
        auto credit = makeTransaction(wallet, 25);

        std::latch start(2);
        std::atomic<bool> creditRejected{false};
        std::thread writer([&]() {
            start.arrive_and_wait();
            try {
                store_->createTransactionWithBalanceUpdate(wallet, credit);
            } catch (const AlreadyDeactivatedError&) {
                creditRejected = true;
            }
        });
        std::thread deactivator([&]() {
            start.arrive_and_wait();
            store_->deactivateWalletWithTransactions(wallet.id());
        });
        writer.join();
        deactivator.join();

        auto after = store_->findWalletById(wallet.id());
        EXPECT_FALSE(after->isActive());
        EXPECT_TRUE(after->balance().isZero());
        EXPECT_TRUE(store_->findActiveTransactionsByWalletId(wallet.id()).empty());
        EXPECT_EQ(store_->transactionExistsByTxid(credit.txid()), !creditRejected.load());
    }
}

// ============================================
// LISTING TESTS
// ============================================

TEST_F(InMemoryLedgerStoreTest, ListWallets_DefaultSortBalanceDesc) {
    auto low = createWallet("Low");
    auto high = createWallet("High");
    auto mid = createWallet("Mid");
    apply(low, 1);
    apply(high, 100);
    apply(mid, 50);

    auto page = store_->listWallets(WalletFilter{}, PageRequest{1, 10, std::nullopt});

    ASSERT_EQ(page.items.size(), 3u);
    EXPECT_EQ(page.items[0].id(), high.id());
    EXPECT_EQ(page.items[1].id(), mid.id());
    EXPECT_EQ(page.items[2].id(), low.id());
    EXPECT_EQ(page.count, 3);
    EXPECT_EQ(page.pages, 1);
}

TEST_F(InMemoryLedgerStoreTest, ListWallets_SortByLabelAsc) {
    createWallet("Charlie");
    createWallet("Alice");
    createWallet("Bob");

    auto page = store_->listWallets(WalletFilter{}, PageRequest{1, 10, std::string("label")});

    ASSERT_EQ(page.items.size(), 3u);
    EXPECT_EQ(page.items[0].label(), "Alice");
    EXPECT_EQ(page.items[1].label(), "Bob");
    EXPECT_EQ(page.items[2].label(), "Charlie");
}

TEST_F(InMemoryLedgerStoreTest, ListWallets_UnknownSortFallsBackToDefault) {
    auto low = createWallet("Low");
    auto high = createWallet("High");
    apply(low, 1);
    apply(high, 100);

    auto page = store_->listWallets(WalletFilter{}, PageRequest{1, 10, std::string("-password")});

    ASSERT_EQ(page.items.size(), 2u);
    EXPECT_EQ(page.items[0].id(), high.id());
}

TEST_F(InMemoryLedgerStoreTest, ListWallets_FilterByActiveAndIds) {
    auto a = createWallet("A");
    auto b = createWallet("B");
    createWallet("C");
    store_->deactivateWalletWithTransactions(b.id());

    auto active = store_->listWallets(WalletFilter{true, {}}, PageRequest{1, 10, std::nullopt});
    EXPECT_EQ(active.count, 2);

    auto inactive = store_->listWallets(WalletFilter{false, {}}, PageRequest{1, 10, std::nullopt});
    ASSERT_EQ(inactive.count, 1);
    EXPECT_EQ(inactive.items[0].id(), b.id());

    auto byIds = store_->listWallets(WalletFilter{std::nullopt, {a.id(), b.id()}}, PageRequest{1, 10, std::nullopt});
    EXPECT_EQ(byIds.count, 2);
}

TEST_F(InMemoryLedgerStoreTest, ListWallets_PageBeyondLastYieldsLastPage) {
    for (int i = 0; i < 5; ++i) {
        createWallet("W" + std::to_string(i));
    }

    auto page = store_->listWallets(WalletFilter{}, PageRequest{9, 2, std::string("label")});

    EXPECT_EQ(page.page, 3);
    EXPECT_EQ(page.pages, 3);
    EXPECT_EQ(page.count, 5);
    ASSERT_EQ(page.items.size(), 1u);
    EXPECT_EQ(page.items[0].label(), "W4");
}

TEST_F(InMemoryLedgerStoreTest, ListWallets_EmptyHasOnePage) {
    auto page = store_->listWallets(WalletFilter{}, PageRequest{1, 10, std::nullopt});

    EXPECT_TRUE(page.items.empty());
    EXPECT_EQ(page.count, 0);
    EXPECT_EQ(page.pages, 1);
    EXPECT_EQ(page.page, 1);
}

TEST_F(InMemoryLedgerStoreTest, ListTransactions_SortByAmountAndFilterByWallet) {
    auto a = createWallet("A");
    auto b = createWallet("B");
    apply(a, 30);
    apply(a, 10);
    apply(a, 20);
    apply(b, 99);

    auto page = store_->listTransactions(TransactionFilter{std::nullopt, {a.id()}},
                                         PageRequest{1, 10, std::string("amount")});

    ASSERT_EQ(page.items.size(), 3u);
    EXPECT_EQ(page.items[0].amount(), Money(10));
    EXPECT_EQ(page.items[1].amount(), Money(20));
    EXPECT_EQ(page.items[2].amount(), Money(30));
}

TEST_F(InMemoryLedgerStoreTest, FindActiveTransactionsByWalletIds_OrderedByCreatedAt) {
    auto a = createWallet("A");
    auto b = createWallet("B");
    apply(a, 1);
    apply(b, 2);
    apply(a, 3);

    auto txs = store_->findActiveTransactionsByWalletIds({a.id(), b.id()});

    ASSERT_EQ(txs.size(), 3u);
    for (size_t i = 1; i < txs.size(); ++i) {
        EXPECT_LE(txs[i - 1].createdAt(), txs[i].createdAt());
    }
}
