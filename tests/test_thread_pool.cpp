#include "cbxconv/thread_pool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace cbxconv;

TEST(ThreadPoolTest, RunsAllTasksAndReturnsResults) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.enqueue([i] { return i * i; }));
    }
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ZeroMeansHardwareThreads) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), ThreadPool::hardware_threads());
    EXPECT_GE(pool.size(), 1u);
}

TEST(ThreadPoolTest, WaitAllDrainsQueue) {
    ThreadPool pool(2);
    std::atomic<int> done{0};
    for (int i = 0; i < 20; ++i) {
        pool.enqueue([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            done++;
        });
    }
    pool.wait_all();
    EXPECT_EQ(done.load(), 20);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto future = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // pool lebt danach weiter
    auto next = pool.enqueue([] { return 7; });
    EXPECT_EQ(next.get(), 7);
}

TEST(ThreadPoolTest, DestructorFinishesQueuedTasks) {
    std::atomic<int> done{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 10; ++i) {
            pool.enqueue([&done] { done++; });
        }
    }
    EXPECT_EQ(done.load(), 10);
}
