#include <gtest/gtest.h>
#include "core/ThreadPool.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

using namespace fence;

TEST(ThreadPoolTest, BasicExecution) {
    ThreadPool pool(2);
    std::atomic<int> counter{0};

    auto future = pool.Enqueue([&counter]() {
        counter++;
        return 42;
    });

    EXPECT_EQ(future.get(), 42);
    EXPECT_EQ(counter, 1);
}

TEST(ThreadPoolTest, MultipleTasks) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 50; ++i) {
        futures.push_back(pool.Enqueue([&counter]() { counter++; }));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_EQ(counter, 50);
}

TEST(ThreadPoolTest, ZeroThreadsFallsBackToOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.GetWorkerCount(), 1u);
    EXPECT_EQ(pool.Enqueue([]() { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, SingleWorkerRunsInSubmissionOrder) {
    ThreadPool pool(1);
    std::vector<int> order;

    for (int i = 0; i < 20; ++i) {
        pool.Enqueue([&order, i]() { order.push_back(i); });
    }
    pool.WaitIdle();

    ASSERT_EQ(order.size(), 20u);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

TEST(ThreadPoolTest, WaitIdleWaitsForRunningTask) {
    ThreadPool pool(1);
    std::atomic<bool> done{false};

    pool.Enqueue([&done]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        done = true;
    });
    pool.WaitIdle();

    EXPECT_TRUE(done);
    EXPECT_EQ(pool.GetQueueSize(), 0u);
}

TEST(ThreadPoolTest, ShutdownWaitsForTasks) {
    auto pool = std::make_unique<ThreadPool>(2);
    std::atomic<bool> task_completed{false};

    pool->Enqueue([&task_completed]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        task_completed = true;
    });

    pool->Shutdown();
    EXPECT_TRUE(task_completed);
}

TEST(ThreadPoolTest, EnqueueAfterShutdownThrows) {
    ThreadPool pool(1);
    pool.Shutdown();
    pool.Shutdown();

    EXPECT_THROW(pool.Enqueue([]() {}), std::runtime_error);
}
