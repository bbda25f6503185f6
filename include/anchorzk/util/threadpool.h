// ANCHORZK - Thread Pool
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Fixed set of workers pulling jobs from one FIFO queue. Results and
// exceptions come back through std::future.

#ifndef ANCHORZK_UTIL_THREADPOOL_H
#define ANCHORZK_UTIL_THREADPOOL_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace anchorzk {
namespace util {

/**
 * Worker pool used for parallel tree construction.
 *
 * Workers start in the constructor. Shutdown() refuses new jobs, runs
 * whatever is already queued and joins the workers; the destructor
 * calls it.
 */
class ThreadPool {
public:
    /// @param numThreads Worker count; 0 picks hardware concurrency
    explicit ThreadPool(size_t numThreads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Return once no job is queued or running
    void Wait();

    void Shutdown();

    bool IsRunning() const;
    /// Live workers; 0 after Shutdown()
    size_t ThreadCount() const;
    size_t PendingTasks() const;

    /**
     * Queue `f(args...)`. Arguments are copied or moved into the job.
     *
     * @throws std::runtime_error once Shutdown() has begun
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>> {
        using Result = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

        auto job = std::make_shared<std::packaged_task<Result()>>(
            [fn = std::forward<F>(f),
             bound = std::make_tuple(std::forward<Args>(args)...)]() mutable -> Result {
                return std::apply(fn, std::move(bound));
            });
        std::future<Result> future = job->get_future();
        Enqueue([job]() { (*job)(); });
        return future;
    }

private:
    void Enqueue(std::function<void()> job);
    void Run();

    mutable std::mutex mutex_;
    std::condition_variable hasWork_;
    std::condition_variable idle_;
    std::deque<std::function<void()>> queue_;
    std::vector<std::thread> threads_;
    size_t busy_{0};
    bool stopping_{false};
};

/// get() every future in order; the first stored exception propagates
template<typename T>
std::vector<T> WaitAll(std::vector<std::future<T>>& futures) {
    std::vector<T> values;
    values.reserve(futures.size());
    for (auto& f : futures) {
        values.push_back(f.get());
    }
    return values;
}

inline void WaitAll(std::vector<std::future<void>>& futures) {
    for (auto& f : futures) {
        f.get();
    }
}

} // namespace util
} // namespace anchorzk

#endif // ANCHORZK_UTIL_THREADPOOL_H
