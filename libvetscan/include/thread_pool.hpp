/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool shared by the OCR and image-extraction axes.
 */

#ifndef VETSCAN_THREAD_POOL_HPP
#define VETSCAN_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace vetscan {

/**
 * @brief A fixed-size pool of std::jthread workers.
 *
 * @details Tasks are callables taking the worker's `std::stop_token`; the
 * token is triggered when the pool is destroyed. Results and exceptions
 * travel back through the returned std::future. Destruction drains the
 * queue: tasks already enqueued still run, which keeps every future
 * obtained from enqueue() satisfiable.
 */
class ThreadPool {
public:
    /**
     * @param threads Number of workers; 0 is clamped to 1.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency() / 2);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueue a task.
     * @tparam F Callable invocable with a `std::stop_token`.
     * @return Future of the task's result.
     * @throws std::runtime_error if the pool is shutting down.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f));
        auto future = task->get_future();
        {
            std::unique_lock lock(queue_mutex_);
            if (stopping_) throw std::runtime_error("enqueue on stopped ThreadPool");
            tasks_.emplace([task](std::stop_token st) { (*task)(std::move(st)); });
        }
        condition_.notify_one();
        return future;
    }

    /// @return Number of worker threads.
    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

private:
    void worker_loop(const std::stop_token& st);

    std::mutex queue_mutex_;
    std::condition_variable_any condition_;
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stopping_{false};
    std::vector<std::jthread> workers_;
};

} // namespace vetscan

#endif // VETSCAN_THREAD_POOL_HPP
