// ============================================================================
// ACCOUNT LEDGER TEST SUITE
// ============================================================================
// Read-modify-write deposits serialized by a per-account distributed mutex
// ============================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <flightlock/core/accounts/account_ledger.hpp>
#include <flightlock/core/lock/lease_store.hpp>
#include <flightlock/core/lock/lock_service.hpp>

using namespace FlightLock;

namespace {

// Memory lease store whose next N releases fail
class FailingReleaseStore : public LeaseStore {
public:
    bool tryCreate(const std::string& name, const std::string& token,
                   std::chrono::milliseconds ttl) override {
        return inner_.tryCreate(name, token, ttl);
    }
    bool deleteIfOwner(const std::string& name, const std::string& token) override {
        if (failing_releases > 0) {
            --failing_releases;
            throw StoreError("lease store unreachable");
        }
        return inner_.deleteIfOwner(name, token);
    }
    bool extendIfOwner(const std::string& name, const std::string& token,
                       std::chrono::milliseconds ttl) override {
        return inner_.extendIfOwner(name, token, ttl);
    }

    int failing_releases = 0;
    size_t size() const { return inner_.size(); }

private:
    MemoryLeaseStore inner_;
};

} // namespace

// ============================================================================
// TEST CLASS
// ============================================================================
class AccountLedgerTest : public ::testing::Test {
protected:
    MemoryLeaseStore store;
    LockService locks{store, std::chrono::milliseconds(8000)};
    AccountBalances balances;
};

// ============================================================================
// BASIC FUNCTIONALITY TESTS
// ============================================================================

TEST_F(AccountLedgerTest, DepositUpdatesBalance) {
    AccountLedger ledger(locks, balances);

    EXPECT_FALSE(ledger.deposit("acct:42", 100).has_value());
    EXPECT_FALSE(ledger.deposit("acct:42", 50).has_value());

    EXPECT_EQ(ledger.balance("acct:42"), 150);
    EXPECT_EQ(ledger.balance("acct:7"), 0);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(AccountLedgerTest, LockNameFollowsAccount) {
    EXPECT_EQ(AccountLedger::lockNameFor("42"), "add-account:{42}");
}

TEST_F(AccountLedgerTest, RejectsInvalidDeposits) {
    AccountLedger ledger(locks, balances);

    auto noAccount = ledger.deposit("", 100);
    ASSERT_TRUE(noAccount.has_value());
    EXPECT_EQ(noAccount->code, ErrorCode::INVALID_ARGUMENT);

    auto negative = ledger.deposit("acct:42", -5);
    ASSERT_TRUE(negative.has_value());
    EXPECT_EQ(negative->code, ErrorCode::INVALID_ARGUMENT);

    EXPECT_EQ(ledger.balance("acct:42"), 0);
    EXPECT_EQ(locks.metrics().acquired, 0u);
}

// ============================================================================
// CONTENTION TESTS
// ============================================================================

TEST_F(AccountLedgerTest, DepositFailsWhileAccountIsLocked) {
    AccountLedger ledger(locks, balances);
    auto other = locks.newMutex(AccountLedger::lockNameFor("acct:42"));
    ASSERT_FALSE(other->lock().has_value());

    auto err = ledger.deposit("acct:42", 100);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ErrorCode::LOCK_CONTENTION);
    EXPECT_EQ(ledger.balance("acct:42"), 0);

    EXPECT_TRUE(other->unlock().released);
    EXPECT_FALSE(ledger.deposit("acct:42", 100).has_value());
    EXPECT_EQ(ledger.balance("acct:42"), 100);
}

TEST_F(AccountLedgerTest, ConcurrentLedgersLoseNoUpdates) {
    const int NUM_LEDGERS = 4;
    const int DEPOSITS = 10;

    RetryPolicy retry;
    retry.max_attempts = 1000;
    retry.initial_backoff = std::chrono::milliseconds(1);
    retry.max_backoff = std::chrono::milliseconds(5);

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_LEDGERS; ++i) {
        threads.emplace_back([&]() {
            AccountLedger ledger(locks, balances, retry, std::chrono::milliseconds(1));
            for (int d = 0; d < DEPOSITS; ++d) {
                if (ledger.depositWithRetry("acct:42", 100)) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(balances.get("acct:42"), NUM_LEDGERS * DEPOSITS * 100);
    EXPECT_EQ(locks.metrics().released, static_cast<uint64_t>(NUM_LEDGERS * DEPOSITS));
}

TEST_F(AccountLedgerTest, OverrunningLeaseIsReported) {
    LockService shortLocks(store, std::chrono::milliseconds(20));
    AccountLedger slow(shortLocks, balances, RetryPolicy{}, std::chrono::milliseconds(80));

    auto err = slow.deposit("acct:42", 100);

    // The write happened, but the lease expired underneath it
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ErrorCode::LOCK_OWNERSHIP_MISMATCH);
    EXPECT_EQ(balances.get("acct:42"), 100);
    EXPECT_EQ(shortLocks.metrics().ownership_lost, 1u);
}

// ============================================================================
// STORE FAILURE TESTS
// ============================================================================

TEST_F(AccountLedgerTest, TransientReleaseFailureIsRetried) {
    FailingReleaseStore flaky;
    LockService flakyLocks(flaky, std::chrono::milliseconds(8000));
    AccountLedger ledger(flakyLocks, balances);

    flaky.failing_releases = 1;
    EXPECT_FALSE(ledger.deposit("acct:42", 100).has_value());
    EXPECT_EQ(ledger.balance("acct:42"), 100);
    EXPECT_EQ(flaky.size(), 0u);
    EXPECT_EQ(flakyLocks.metrics().store_errors, 1u);
    EXPECT_EQ(flakyLocks.metrics().released, 1u);

    // The account is immediately lockable again
    EXPECT_FALSE(ledger.deposit("acct:42", 50).has_value());
    EXPECT_EQ(ledger.balance("acct:42"), 150);
}

TEST_F(AccountLedgerTest, PersistentReleaseFailureIsReported) {
    FailingReleaseStore flaky;
    LockService flakyLocks(flaky, std::chrono::milliseconds(8000));
    AccountLedger ledger(flakyLocks, balances);

    flaky.failing_releases = 2;
    auto err = ledger.deposit("acct:42", 100);

    // Applied, but the lease is left to expire
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ErrorCode::STORE_UNAVAILABLE);
    EXPECT_EQ(ledger.balance("acct:42"), 100);
    EXPECT_EQ(flaky.size(), 1u);
    EXPECT_EQ(flakyLocks.metrics().store_errors, 2u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
