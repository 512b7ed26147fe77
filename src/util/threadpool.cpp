// STAKEGUARD - Thread Pool Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/util/threadpool.h"
#include "stakeguard/util/logging.h"

#include <algorithm>
#include <stdexcept>

namespace stakeguard {
namespace util {

namespace {

ThreadPool::Config WithThreads(size_t numThreads) {
    ThreadPool::Config config;
    config.numThreads = numThreads;
    return config;
}

} // namespace

ThreadPool::ThreadPool(size_t numThreads) : ThreadPool(WithThreads(numThreads)) {}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    size_t count = std::max<size_t>(config_.numThreads, 1);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] { Run(); });
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            throw std::runtime_error("ThreadPool " + config_.name + " not running");
        }
        if (queue_.size() >= config_.maxQueueSize) {
            throw std::runtime_error("ThreadPool " + config_.name + " queue full");
        }
        queue_.push_back(std::move(task));
    }
    taskReady_.notify_one();
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && busy_ == 0; });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
        queue_.clear();
    }
    taskReady_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    idle_.notify_all();
}

void ThreadPool::Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        taskReady_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });
        if (!running_.load()) {
            return;
        }

        std::function<void()> task = std::move(queue_.front());
        queue_.pop_front();
        ++busy_;
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(LogCategory::DEFAULT) << "Task in pool " << config_.name
                                            << " failed: " << e.what();
        }

        lock.lock();
        --busy_;
        if (queue_.empty() && busy_ == 0) {
            idle_.notify_all();
        }
    }
}

} // namespace util
} // namespace stakeguard
