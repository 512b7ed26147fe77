// STAKEGUARD - Thread Pool
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Fixed-size worker pool. The daemon runs two: "query" fans out the
// per-address balance queries, "notify" delivers webhooks without
// blocking the loop that raised them.

#ifndef STAKEGUARD_UTIL_THREADPOOL_H
#define STAKEGUARD_UTIL_THREADPOOL_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <tuple>
#include <type_traits>
#include <vector>

namespace stakeguard {
namespace util {

class ThreadPool {
public:
    struct Config {
        size_t numThreads{4};
        size_t maxQueueSize{256};
        std::string name{"pool"};
    };

    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);

    /// Joins the workers; tasks still queued are dropped
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Block until nothing is queued or executing
    void Wait();

    void Shutdown();

    bool IsRunning() const { return running_.load(); }
    size_t ThreadCount() const { return workers_.size(); }

    /**
     * Queue `f(args...)` and return its future. An exception thrown by the
     * task surfaces from future::get().
     *
     * @throws std::runtime_error when the pool is shut down or the queue is full
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using R = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<R()>>(
            [fn = std::forward<F>(f), bound = std::make_tuple(std::forward<Args>(args)...)]() mutable {
                return std::apply(fn, std::move(bound));
            });
        std::future<R> result = task->get_future();
        Enqueue([task]() { (*task)(); });
        return result;
    }

    /// Queue a task whose result nobody waits for. Escaping exceptions are logged.
    template<typename F>
    void Execute(F&& f) {
        Enqueue(std::function<void()>(std::forward<F>(f)));
    }

private:
    void Enqueue(std::function<void()> task);
    void Run();

    Config config_;
    std::vector<std::thread> workers_;

    std::mutex mutex_;
    std::condition_variable taskReady_;
    std::condition_variable idle_;
    std::deque<std::function<void()>> queue_;
    size_t busy_{0};

    std::atomic<bool> running_{true};
};

} // namespace util
} // namespace stakeguard

#endif // STAKEGUARD_UTIL_THREADPOOL_H
