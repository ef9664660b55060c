#include "getchunk/core/ParallelUtils.hpp"

#include <algorithm>

namespace getchunk {

// Reads are I/O bound; a handful of workers covers many concurrent streams.
size_t ThreadPool::configured_threads_ =
    std::max<size_t>(1, std::min<size_t>(4, std::thread::hardware_concurrency()));

void ThreadPool::set_num_threads(size_t n) {
    configured_threads_ = std::max<size_t>(1, n);
}

size_t ThreadPool::get_num_threads() {
    return configured_threads_;
}

ThreadPool& ThreadPool::instance() {
    static ThreadPool pool(configured_threads_);
    return pool;
}

ThreadPool::ThreadPool(size_t threads) {
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&ThreadPool::run_worker, this);
    }
}

void ThreadPool::run_worker() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
            if (pending_.empty()) return;  // stopping and drained
            job = std::move(pending_.front());
            pending_.pop();
        }
        job();
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    for (std::thread& worker : workers_) {
        worker.join();
    }
}

} // namespace getchunk
