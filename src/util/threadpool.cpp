// ANCHORZK - Thread Pool Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/util/threadpool.h"

#include <algorithm>
#include <stdexcept>

namespace anchorzk {
namespace util {

ThreadPool::ThreadPool(size_t numThreads) {
    size_t count = numThreads;
    if (count == 0) {
        count = std::max(1u, std::thread::hardware_concurrency());
    }

    threads_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this] { Run(); });
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

bool ThreadPool::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

size_t ThreadPool::ThreadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.size();
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ThreadPool::Enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("ThreadPool: submit after shutdown");
        }
        queue_.push_back(std::move(job));
    }
    hasWork_.notify_one();
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && busy_ == 0; });
}

void ThreadPool::Shutdown() {
    std::vector<std::thread> joining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        joining.swap(threads_);
    }
    hasWork_.notify_all();

    for (std::thread& t : joining) {
        t.join();
    }
}

void ThreadPool::Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        hasWork_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // Stopping with nothing left to drain
            return;
        }

        std::function<void()> job = std::move(queue_.front());
        queue_.pop_front();
        ++busy_;

        lock.unlock();
        job();
        lock.lock();

        --busy_;
        if (queue_.empty() && busy_ == 0) {
            idle_.notify_all();
        }
    }
}

} // namespace util
} // namespace anchorzk
