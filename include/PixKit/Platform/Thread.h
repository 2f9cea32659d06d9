#pragma once

/**
 * @file Thread.h
 * @brief Thread pool and parallel execution utilities
 *
 * Provides:
 * - Explicitly owned thread pool for task execution
 * - ParallelFor over a pool, one index per task chunk
 *
 * Usage:
 * @code
 * ThreadPool pool(4);
 * auto future = pool.Submit([] { return 42; });
 *
 * ParallelFor(pool, 0, images.size(), [&](size_t i) {
 *     results[i] = process(images[i]);
 * });
 * @endcode
 */

#include <PixKit/Core/Export.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace Pix::Kit::Platform {

// ============================================================================
// System Information
// ============================================================================

/**
 * @brief Get number of hardware threads (logical cores)
 * @return Number of threads, minimum 1
 */
PIXKIT_API size_t GetNumCores();

/**
 * @brief Get recommended number of worker threads
 * @return GetNumCores() - 1, minimum 1
 *
 * Leaves one core for the calling thread.
 */
PIXKIT_API size_t GetRecommendedThreadCount();

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * @brief Simple thread pool for parallel task execution
 *
 * Owned by whoever creates it; there is no process-wide instance.
 * Destruction drains the queue, then joins all workers.
 */
class PIXKIT_API ThreadPool {
public:
    /**
     * @brief Create pool with the given number of workers
     * @param numThreads Worker count (0 = GetRecommendedThreadCount())
     */
    explicit ThreadPool(size_t numThreads = 0);

    /**
     * @brief Destructor - waits for all tasks to complete
     */
    ~ThreadPool();

    // Non-copyable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Get number of worker threads
     */
    size_t Size() const { return workers_.size(); }

    /**
     * @brief Check if pool is running
     */
    bool IsRunning() const { return !stop_; }

    /**
     * @brief Submit a task and get a future for the result
     * @param f Function to execute
     * @param args Arguments to pass
     * @return Future for the result (exceptions are delivered through it)
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    /**
     * @brief Wait for all pending tasks to complete
     */
    void WaitAll();

    /**
     * @brief Get number of pending tasks (queued + running)
     */
    size_t PendingTasks() const;

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completionCondition_;
    std::atomic<bool> stop_{false};
    std::atomic<size_t> activeTasks_{0};
};

// ============================================================================
// Parallel For
// ============================================================================

/**
 * @brief Execute a function for each index in range [begin, end) on a pool
 * @param pool Pool that runs the chunks
 * @param begin Start index (inclusive)
 * @param end End index (exclusive)
 * @param func Function to call with each index
 *
 * Blocks until every chunk is done. The first exception thrown by func is
 * rethrown after all chunks have finished. Must not be called from a task
 * running on the same pool.
 */
template<typename Func>
void ParallelFor(ThreadPool& pool, size_t begin, size_t end, Func&& func);

// ============================================================================
// Template Implementations
// ============================================================================

template<typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using ReturnType = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<ReturnType> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

template<typename Func>
void ParallelFor(ThreadPool& pool, size_t begin, size_t end, Func&& func) {
    if (begin >= end) return;

    size_t count = end - begin;

    // Single item or single worker: run inline
    if (count == 1 || pool.Size() <= 1) {
        for (size_t i = begin; i < end; ++i) {
            func(i);
        }
        return;
    }

    size_t numChunks = std::min(count, pool.Size());
    size_t chunkSize = count / numChunks;
    size_t remainder = count % numChunks;

    std::vector<std::future<void>> futures;
    futures.reserve(numChunks);

    size_t current = begin;
    for (size_t chunk = 0; chunk < numChunks; ++chunk) {
        size_t thisChunkSize = chunkSize + (chunk < remainder ? 1 : 0);
        size_t chunkEnd = current + thisChunkSize;

        futures.push_back(pool.Submit([&func, current, chunkEnd]() {
            for (size_t i = current; i < chunkEnd; ++i) {
                func(i);
            }
        }));

        current = chunkEnd;
    }

    // Wait for every chunk before propagating, func may reference caller state
    std::exception_ptr firstError;
    for (auto& f : futures) {
        try {
            f.get();
        } catch (...) {
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

} // namespace Pix::Kit::Platform
