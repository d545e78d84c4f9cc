#ifndef PIIREDACT_UTIL_THREAD_POOL_HPP
#define PIIREDACT_UTIL_THREAD_POOL_HPP

#include <algorithm>
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

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used to redact independent documents in parallel.
 *
 * Usage Example:
 *  @code
 *    piiredact::util::ThreadPool pool(4);
 *    auto done = pool.enqueue([&] { return redactor.redact(text, spans); });
 *    RedactionResult r = done.get();   // rethrows whatever the task threw
 *  @endcode
 */

namespace piiredact {
namespace util {

class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. If zero, uses hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    /**
     * @brief Drains the queue, then joins every worker.
     */
    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t workerCount() const { return workers_.size(); }

    /**
     * @brief Queue a callable. Exceptions it throws surface from the returned future's get().
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using ReturnType = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool: enqueue on stopped pool");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        condVar_.notify_one();
        return result;
    }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condVar_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
};

} // namespace util
} // namespace piiredact

#endif // PIIREDACT_UTIL_THREAD_POOL_HPP
