#include "ThreadPool.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace SkipKP;

TEST(ThreadPoolTest, RunsTask) {
    ThreadPool pool(2);
    EXPECT_EQ(pool.size(), 2u);

    std::atomic<bool> executed{false};
    auto future = pool.enqueue([&executed]() { executed = true; });
    future.wait();
    EXPECT_TRUE(executed);
}

TEST(ThreadPoolTest, RunsManyTasks) {
    ThreadPool pool(4);

    const int taskCount = 100;
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < taskCount; ++i) {
        futures.push_back(pool.enqueue([&counter]() {
            counter++;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }));
    }
    for (auto& f : futures) {
        f.wait();
    }
    EXPECT_EQ(counter, taskCount);
}

TEST(ThreadPoolTest, FuturePropagatesException) {
    ThreadPool pool(1);
    auto future = pool.enqueue([]() { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, ShutdownDrainsQueueThenRejects) {
    std::atomic<int> counter{0};
    ThreadPool pool(1);
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(pool.tryPost([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            counter++;
        }));
    }

    pool.shutdown();
    EXPECT_EQ(counter, 10);

    EXPECT_FALSE(pool.tryPost([&counter]() { counter++; }));
    auto dropped = pool.enqueue([&counter]() { counter++; });
    EXPECT_THROW(dropped.get(), std::future_error);
    EXPECT_EQ(counter, 10);
}

TEST(ThreadPoolTest, ZeroPicksHardwareConcurrency) {
    ThreadPool pool(0);
    EXPECT_GE(pool.size(), 1u);
    auto future = pool.enqueue([]() {});
    EXPECT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST(ThreadPoolTest, ShutdownIsIdempotent) {
    ThreadPool pool(2);
    std::atomic<int> counter{0};
    pool.enqueue([&counter]() { counter++; }).wait();

    pool.shutdown();
    pool.shutdown();
    EXPECT_EQ(counter, 1);
}
