#include <gtest/gtest.h>
#include "getchunk/core/ParallelUtils.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace getchunk;

TEST(ThreadPoolTest, EnqueueReturnsValues) {
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i) {
        futures.push_back(ThreadPool::instance().enqueue([i]() { return i * i; }));
    }
    for (int i = 0; i < 32; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ExceptionPropagation) {
    auto future = ThreadPool::instance().enqueue([]() -> int {
        throw std::runtime_error("Test Exception");
    });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, SlowTaskDoesNotBlockOthers) {
    if (ThreadPool::instance().size() < 2) {
        GTEST_SKIP() << "needs at least two workers";
    }
    std::atomic<bool> release{false};
    auto slow = ThreadPool::instance().enqueue([&release]() {
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    });
    auto fast = ThreadPool::instance().enqueue([]() { return 7; });
    EXPECT_EQ(fast.get(), 7);
    release.store(true);
    slow.get();
}

TEST(ThreadPoolTest, NumThreadsIsAtLeastOne) {
    size_t saved = ThreadPool::get_num_threads();
    ThreadPool::set_num_threads(0);
    EXPECT_EQ(ThreadPool::get_num_threads(), 1u);
    ThreadPool::set_num_threads(saved);
}

TEST(ThreadPoolTest, AcceptsMoveOnlyTasks) {
    auto payload = std::make_unique<int>(41);
    auto future = ThreadPool::instance().enqueue([p = std::move(payload)]() { return *p + 1; });
    EXPECT_EQ(future.get(), 42);
}
