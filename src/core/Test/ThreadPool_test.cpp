/**
 * ThreadPool_test.cpp
 */

#include "../ThreadPool.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using downpour::core::ThreadPool;

namespace {

TEST(ThreadPoolTest, SubmitReturnsResult)
{
    ThreadPool pool(2);
    auto future = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(future.get(), 5);
    EXPECT_EQ(pool.size(), 2u);
}

TEST(ThreadPoolTest, SingleWorkerRunsJobsInSubmissionOrder)
{
    ThreadPool pool(1);
    std::vector<int> order;
    std::mutex mutex;

    for (int i = 0; i < 10; ++i) {
        pool.submit([&, i] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        });
    }
    pool.waitAll();

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
}

TEST(ThreadPoolTest, NeverRunsMoreJobsThanWorkers)
{
    ThreadPool pool(3);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    for (int i = 0; i < 12; ++i) {
        pool.submit([&] {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --running;
        });
    }
    pool.waitAll();

    EXPECT_LE(peak.load(), 3);
    EXPECT_EQ(pool.pendingTasks(), 0u);
}

TEST(ThreadPoolTest, ExceptionReachesFuture)
{
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("job failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // Worker survives
    EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}

TEST(ThreadPoolTest, ShutdownDrainsQueueAndRejectsNewJobs)
{
    ThreadPool pool(1);
    std::atomic<int> done{0};

    for (int i = 0; i < 5; ++i) {
        pool.submit([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            ++done;
        });
    }
    pool.shutdown();

    EXPECT_EQ(done.load(), 5);
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);
    // Idempotent
    EXPECT_NO_THROW(pool.shutdown());
}

} // namespace
