/**
 * @file WorkerPool.cpp
 */

#include "orbtarget/core/WorkerPool.hpp"
#include <algorithm>
#include <exception>

namespace orbtarget {

WorkerPool::WorkerPool(std::size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::max(1u, std::thread::hardware_concurrency());
    }
    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;  // stop_ and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        // packaged_task stores any exception in its shared state
        task();
    }
}

void WorkerPool::parallel_for(std::size_t count, const std::function<void(std::size_t)>& body) {
    std::vector<std::future<void>> futures;
    futures.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        futures.push_back(submit([&body, i]() { body(i); }));
    }

    // Join everything before rethrowing so no task outlives the caller's data
    std::exception_ptr first_error;
    for (auto& future : futures) {
        try {
            future.get();
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace orbtarget
