#include "StoreFixture.hpp"
#include "db/errors.hpp"

#include <stdexcept>

using namespace tfs;
using namespace tfs::db;
using namespace tfs::fs::model;

class TransactionsTest : public test::StoreFixture {
protected:
    static void addFolder(Txn& txn, const std::string& id) { txn.insertFolder({id, ROOT_ID, id}); }
};

TEST_F(TransactionsTest, CommitsOnSuccess) {
    Transactions::exec("test", [](Txn& txn) { addFolder(txn, "a"); });
    EXPECT_EQ(store->commits(), 1u);
    EXPECT_EQ(store->totalFolders(), 2u);
}

TEST_F(TransactionsTest, ReturnsClosureResult) {
    const auto n = Transactions::exec("test", [](Txn& txn) {
        addFolder(txn, "a");
        return 42;
    });
    EXPECT_EQ(n, 42);
}

TEST_F(TransactionsTest, RetriesTransientCommitFailure) {
    store->failNextCommits(2);
    unsigned int calls = 0;
    Transactions::exec("test", [&](Txn& txn) {
        ++calls;
        addFolder(txn, "a");
    });
    EXPECT_EQ(calls, 3u);
    EXPECT_EQ(store->commits(), 1u);
    EXPECT_EQ(store->totalFolders(), 2u);
}

TEST_F(TransactionsTest, RetriesTransientSessionFailure) {
    store->failNextBegins(1);
    const auto folders = Transactions::read("test", [](Txn& txn) { return txn.scanFolders().size(); });
    EXPECT_EQ(folders, 1u);
}

TEST_F(TransactionsTest, RetriesTransientErrorThrownByClosure) {
    unsigned int calls = 0;
    Transactions::exec("test", [&](Txn& txn) {
        if (++calls == 1) throw TransientError("conflict");
        addFolder(txn, "a");
    });
    EXPECT_EQ(calls, 2u);
}

TEST_F(TransactionsTest, GivesUpAfterMaxAttempts) {
    // the test config allows four attempts
    store->failNextCommits(100);
    unsigned int calls = 0;
    try {
        Transactions::exec("bounded", [&](Txn& txn) {
            ++calls;
            addFolder(txn, "a");
        });
        FAIL() << "expected RetriesExhaustedError";
    } catch (const RetriesExhaustedError& e) {
        EXPECT_EQ(e.attempts(), 4u);
        EXPECT_NE(std::string(e.what()).find("bounded"), std::string::npos);
    }
    EXPECT_EQ(calls, 4u);
    EXPECT_EQ(store->commits(), 0u);
    EXPECT_EQ(store->totalFolders(), 1u);
}

TEST_F(TransactionsTest, ThrowingClosureIsNeverCommitted) {
    unsigned int calls = 0;
    EXPECT_THROW(Transactions::exec("test", [&](Txn& txn) {
        ++calls;
        addFolder(txn, "a");
        throw std::runtime_error("boom");
    }), std::runtime_error);
    EXPECT_EQ(calls, 1u);
    EXPECT_EQ(store->commits(), 0u);
    EXPECT_EQ(store->totalFolders(), 1u);
}

TEST_F(TransactionsTest, ConstraintViolationIsNotRetried) {
    Transactions::exec("test", [](Txn& txn) { addFolder(txn, "a"); });
    unsigned int calls = 0;
    EXPECT_THROW(Transactions::exec("test", [&](Txn& txn) {
        ++calls;
        addFolder(txn, "a");
    }), ConstraintError);
    EXPECT_EQ(calls, 1u);
}

TEST_F(TransactionsTest, ReadNeverCommits) {
    (void)Transactions::read("test", [](Txn& txn) { return txn.scanFiles(); });
    EXPECT_EQ(store->commits(), 0u);
}

TEST_F(TransactionsTest, ReadOnlyTransactionRejectsWrites) {
    EXPECT_THROW(Transactions::read("test", [](Txn& txn) { addFolder(txn, "a"); }), std::logic_error);
}

TEST_F(TransactionsTest, SnapshotDoesNotSeeLaterCommits) {
    auto snapshot = store->begin(TxMode::ReadOnly);
    Transactions::exec("test", [](Txn& txn) { addFolder(txn, "a"); });

    EXPECT_FALSE(snapshot->getFolder("a").has_value());
    EXPECT_TRUE(store->begin(TxMode::ReadOnly)->getFolder("a").has_value());
}

TEST_F(TransactionsTest, RootIsNeverDeleted) {
    Transactions::exec("test", [](Txn& txn) { txn.deleteFolders({ROOT_ID}); });
    EXPECT_TRUE(store->begin(TxMode::ReadOnly)->getFolder(ROOT_ID).has_value());
}
