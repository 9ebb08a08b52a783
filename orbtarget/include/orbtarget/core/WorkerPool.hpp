/**
 * @file WorkerPool.hpp
 * @brief Fixed-size thread pool with fork/join helpers
 *
 * Exceptions thrown by a task are stored in its future and rethrown to the
 * thread that joins it.
 */

#ifndef ORBTARGET_CORE_WORKER_POOL_HPP
#define ORBTARGET_CORE_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace orbtarget {

class WorkerPool {
public:
    /**
     * @brief Start the workers
     * @param num_threads Number of worker threads (0 = hardware concurrency)
     */
    explicit WorkerPool(std::size_t num_threads = 0);

    /// Finishes the queued tasks, then joins the workers
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a task
     * @return Future holding the result or the exception thrown by @p f
     */
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) {
                throw std::runtime_error("WorkerPool: submit after shutdown");
            }
            tasks_.emplace_back([task]() { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    /**
     * @brief Run body(i) for i in [0, count) and wait for all of them
     *
     * Every task is joined before returning. If any task threw, the first
     * exception (lowest index) is rethrown.
     */
    void parallel_for(std::size_t count, const std::function<void(std::size_t)>& body);

    std::size_t num_threads() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

} // namespace orbtarget

#endif // ORBTARGET_CORE_WORKER_POOL_HPP
