#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace getchunk {

/**
 * @brief Worker pool that runs blocking source reads for ChunkStream.
 *
 * Workers are started lazily on first use of instance(); set_num_threads()
 * only has an effect before that point.
 */
class ThreadPool {
public:
    static ThreadPool& instance();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drains queued reads, then joins workers
    ~ThreadPool();

    /**
     * @brief Queues a callable; its result or exception arrives through the future.
     * @throws std::runtime_error once the pool is shutting down.
     */
    template<class Task>
    std::future<std::invoke_result_t<Task>> enqueue(Task&& task);

    size_t size() const { return workers_.size(); }

    static void set_num_threads(size_t n);
    static size_t get_num_threads();

private:
    explicit ThreadPool(size_t threads);

    void run_worker();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> pending_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;

    static size_t configured_threads_;
};

template<class Task>
std::future<std::invoke_result_t<Task>> ThreadPool::enqueue(Task&& task) {
    using Result = std::invoke_result_t<Task>;

    // std::function needs a copyable target, so the packaged_task is shared.
    auto job = std::make_shared<std::packaged_task<Result()>>(std::forward<Task>(task));
    std::future<Result> result = job->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("ThreadPool is shutting down");
        }
        pending_.emplace([job]() { (*job)(); });
    }
    wake_.notify_one();
    return result;
}

} // namespace getchunk
