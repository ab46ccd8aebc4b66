// ============================================================================
// REQUEST COALESCER TEST SUITE
// ============================================================================
// - One execution per generation for concurrent callers of one key
// - Values, errors and exceptions shared with every joined caller
// - forget() only affects future callers
// - Independent keys run in parallel
// - Async variant with caller-side timeouts
// ============================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include <flightlock/core/coalescer/request_coalescer.hpp>
#include <flightlock/core/utils/thread_pool.hpp>

using namespace FlightLock;

namespace {

// Blocks work functions until opened
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    bool wait(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

bool waitUntil(const std::function<bool()>& predicate,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return predicate();
}

} // namespace

// ============================================================================
// TEST CLASS
// ============================================================================
class RequestCoalescerTest : public ::testing::Test {
protected:
    RequestCoalescer<int> coalescer{"test"};
    std::atomic<int> runs{0};
};

// ============================================================================
// BASIC FUNCTIONALITY TESTS
// ============================================================================

TEST_F(RequestCoalescerTest, SingleCallerGetsValue) {
    auto result = coalescer.execute("product:1", [this]() {
        runs.fetch_add(1);
        return KeyedResult<int>::success(42);
    });

    ASSERT_TRUE(result.found());
    EXPECT_EQ(*result.value, 42);
    EXPECT_FALSE(result.shared);
    EXPECT_EQ(runs.load(), 1);
    EXPECT_EQ(coalescer.inFlight(), 0u);
}

TEST_F(RequestCoalescerTest, EmptyKeyIsRejectedWithoutRunningWork) {
    auto result = coalescer.execute("", [this]() {
        runs.fetch_add(1);
        return KeyedResult<int>::success(1);
    });

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(runs.load(), 0);
    EXPECT_EQ(coalescer.metrics().rejected, 1u);
}

TEST_F(RequestCoalescerTest, NotFoundIsAValidResult) {
    auto result = coalescer.execute("product:404", []() {
        return KeyedResult<int>::notFound();
    });

    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.found());
}

// ============================================================================
// COALESCING TESTS
// ============================================================================

TEST_F(RequestCoalescerTest, ConcurrentCallersShareOneExecution) {
    const int NUM_CALLERS = 10;
    Gate gate;
    std::vector<KeyedResult<int>> results(NUM_CALLERS);
    std::vector<std::thread> threads;

    auto work = [this, &gate]() {
        runs.fetch_add(1);
        gate.wait();
        return KeyedResult<int>::success(7);
    };

    threads.emplace_back([&, work]() { results[0] = coalescer.execute("product:1", work); });
    ASSERT_TRUE(waitUntil([this] { return runs.load() == 1; }));

    for (int i = 1; i < NUM_CALLERS; ++i) {
        threads.emplace_back([&, i, work]() { results[i] = coalescer.execute("product:1", work); });
    }

    // Every follower must have joined before the leader finishes
    ASSERT_TRUE(waitUntil([this] { return coalescer.metrics().joins == NUM_CALLERS - 1; }));
    gate.open();

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(runs.load(), 1);
    for (const auto& r : results) {
        ASSERT_TRUE(r.found());
        EXPECT_EQ(*r.value, 7);
        EXPECT_TRUE(r.shared);
    }
    EXPECT_EQ(coalescer.inFlight(), 0u);
    EXPECT_DOUBLE_EQ(coalescer.metrics().fanout(), static_cast<double>(NUM_CALLERS));
}

TEST_F(RequestCoalescerTest, ErrorIsSharedWithEveryWaiter) {
    Gate gate;
    KeyedResult<int> leader, follower;

    auto work = [this, &gate]() {
        runs.fetch_add(1);
        gate.wait();
        return KeyedResult<int>::failure(ErrorCode::TRANSIENT_FETCH, "upstream timeout");
    };

    std::thread t1([&]() { leader = coalescer.execute("product:1", work); });
    ASSERT_TRUE(waitUntil([this] { return runs.load() == 1; }));
    std::thread t2([&]() { follower = coalescer.execute("product:1", work); });
    ASSERT_TRUE(waitUntil([this] { return coalescer.metrics().joins == 1; }));
    gate.open();
    t1.join();
    t2.join();

    ASSERT_FALSE(leader.ok());
    ASSERT_FALSE(follower.ok());
    EXPECT_EQ(*leader.error, *follower.error);
    EXPECT_EQ(leader.error->code, ErrorCode::TRANSIENT_FETCH);
    EXPECT_EQ(runs.load(), 1);
    EXPECT_EQ(coalescer.metrics().failures, 1u);
}

TEST_F(RequestCoalescerTest, ExceptionIsRethrownToEveryCaller) {
    Gate gate;
    std::atomic<int> caught{0};

    auto work = [this, &gate]() -> KeyedResult<int> {
        runs.fetch_add(1);
        gate.wait();
        throw std::runtime_error("decoder exploded");
    };

    auto caller = [&]() {
        try {
            coalescer.execute("product:1", work);
        } catch (const std::runtime_error& e) {
            if (std::string(e.what()) == "decoder exploded") {
                caught.fetch_add(1);
            }
        }
    };

    std::thread t1(caller);
    ASSERT_TRUE(waitUntil([this] { return runs.load() == 1; }));
    std::thread t2(caller);
    ASSERT_TRUE(waitUntil([this] { return coalescer.metrics().joins == 1; }));
    gate.open();
    t1.join();
    t2.join();

    EXPECT_EQ(caught.load(), 2);
    EXPECT_EQ(coalescer.inFlight(), 0u);

    // The key is usable again
    auto next = coalescer.execute("product:1", []() { return KeyedResult<int>::success(3); });
    ASSERT_TRUE(next.found());
    EXPECT_EQ(*next.value, 3);
}

// ============================================================================
// GENERATION TESTS
// ============================================================================

TEST_F(RequestCoalescerTest, CompletedCallIsNotCached) {
    auto work = [this]() { return KeyedResult<int>::success(runs.fetch_add(1) + 1); };

    auto first = coalescer.execute("product:1", work);
    auto second = coalescer.execute("product:1", work);

    EXPECT_EQ(runs.load(), 2);
    EXPECT_EQ(*first.value, 1);
    EXPECT_EQ(*second.value, 2);
}

TEST_F(RequestCoalescerTest, FailureDoesNotStick) {
    auto failed = coalescer.execute("product:1", []() {
        return KeyedResult<int>::failure(ErrorCode::TRANSIENT_FETCH, "boom");
    });
    auto recovered = coalescer.execute("product:1", []() {
        return KeyedResult<int>::success(5);
    });

    EXPECT_FALSE(failed.ok());
    ASSERT_TRUE(recovered.found());
    EXPECT_EQ(*recovered.value, 5);
}

TEST_F(RequestCoalescerTest, ForgetStartsFreshExecutionWithoutDisturbingWaiters) {
    Gate slowGate;
    Gate freshGate;
    KeyedResult<int> slowLeader, slowFollower, fresh;

    auto slow = [&]() {
        runs.fetch_add(1);
        slowGate.wait();
        return KeyedResult<int>::success(1);
    };
    auto freshWork = [&]() {
        runs.fetch_add(1);
        freshGate.wait();
        return KeyedResult<int>::success(2);
    };

    std::thread t1([&]() { slowLeader = coalescer.execute("product:1", slow); });
    ASSERT_TRUE(waitUntil([this] { return runs.load() == 1; }));
    std::thread t2([&]() { slowFollower = coalescer.execute("product:1", slow); });
    ASSERT_TRUE(waitUntil([this] { return coalescer.metrics().joins == 1; }));

    EXPECT_TRUE(coalescer.forget("product:1"));
    EXPECT_EQ(coalescer.inFlight(), 0u);

    std::thread t3([&]() { fresh = coalescer.execute("product:1", freshWork); });
    ASSERT_TRUE(waitUntil([this] { return runs.load() == 2; }));

    // The forgotten Call finishing must leave the newer one registered
    slowGate.open();
    t1.join();
    t2.join();
    EXPECT_EQ(coalescer.inFlight(), 1u);

    freshGate.open();
    t3.join();

    EXPECT_EQ(*slowLeader.value, 1);
    EXPECT_EQ(*slowFollower.value, 1);
    EXPECT_EQ(*fresh.value, 2);
    EXPECT_EQ(coalescer.inFlight(), 0u);
    EXPECT_EQ(coalescer.metrics().forgets, 1u);
}

TEST_F(RequestCoalescerTest, ForgetUnknownKeyIsNoop) {
    EXPECT_FALSE(coalescer.forget("product:missing"));
    EXPECT_EQ(coalescer.metrics().forgets, 0u);
}

// ============================================================================
// CONCURRENCY ACROSS KEYS
// ============================================================================

TEST_F(RequestCoalescerTest, IndependentKeysRunInParallel) {
    std::mutex m;
    std::condition_variable cv;
    int started = 0;

    // Each work function waits for the other one to start; serialized keys would time out
    auto work = [&]() {
        std::unique_lock<std::mutex> lock(m);
        ++started;
        cv.notify_all();
        bool both = cv.wait_for(lock, std::chrono::seconds(5), [&] { return started == 2; });
        return KeyedResult<int>::success(both ? 1 : 0);
    };

    KeyedResult<int> a, b;
    std::thread t1([&]() { a = coalescer.execute("product:1", work); });
    std::thread t2([&]() { b = coalescer.execute("product:2", work); });
    t1.join();
    t2.join();

    EXPECT_EQ(*a.value, 1);
    EXPECT_EQ(*b.value, 1);
    EXPECT_EQ(coalescer.metrics().executions, 2u);
}

// ============================================================================
// ASYNC VARIANT
// ============================================================================

TEST_F(RequestCoalescerTest, AsyncCallerTimeoutDoesNotCancelCall) {
    ThreadPool pool(2);
    Gate gate;

    auto work = [this, &gate]() {
        runs.fetch_add(1);
        gate.wait();
        return KeyedResult<int>::success(9);
    };

    auto impatient = coalescer.executeAsync("product:1", work, pool);
    EXPECT_EQ(impatient.wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);

    auto patient = coalescer.executeAsync("product:1", work, pool);
    gate.open();

    auto result = patient.get();
    ASSERT_TRUE(result.found());
    EXPECT_EQ(*result.value, 9);
    EXPECT_TRUE(result.shared);
    EXPECT_EQ(runs.load(), 1);

    // The caller that gave up can still read the same outcome later
    EXPECT_EQ(*impatient.get().value, 9);
}

TEST_F(RequestCoalescerTest, AsyncOnStoppedPoolDeliversException) {
    ThreadPool pool(1);
    pool.shutdown();

    auto future = coalescer.executeAsync("product:1", []() {
        return KeyedResult<int>::success(1);
    }, pool);

    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_EQ(coalescer.inFlight(), 0u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
