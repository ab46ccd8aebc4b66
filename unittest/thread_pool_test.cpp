// ============================================================================
// THREAD POOL TEST SUITE
// ============================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <flightlock/core/utils/thread_pool.hpp>

using namespace FlightLock;

TEST(ThreadPoolTest, RunsAllSubmittedTasks) {
    std::atomic<int> done{0};
    {
        ThreadPool pool(4);
        EXPECT_EQ(pool.size(), 4u);
        for (int i = 0; i < 100; ++i) {
            pool.submit([&done]() { done.fetch_add(1); });
        }
        pool.shutdown();
    }
    EXPECT_EQ(done.load(), 100);
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    std::atomic<int> done{0};
    ThreadPool pool(1);

    pool.submit([]() { throw std::runtime_error("task failure"); });
    pool.submit([&done]() { done.fetch_add(1); });
    pool.shutdown();

    EXPECT_EQ(done.load(), 1);
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
    ThreadPool pool(2);
    pool.shutdown();
    pool.shutdown();

    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);
    EXPECT_EQ(pool.getPendingTasks(), 0u);
}

TEST(ThreadPoolTest, ZeroThreadsStillRuns) {
    std::atomic<int> done{0};
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);

    pool.submit([&done]() { done.fetch_add(1); });
    pool.shutdown();
    EXPECT_EQ(done.load(), 1);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
