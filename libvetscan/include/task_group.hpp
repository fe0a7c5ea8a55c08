/**
 * @file task_group.hpp
 * @brief Fan-out/fan-in of homogeneous tasks with fail-fast cancellation.
 */

#ifndef VETSCAN_TASK_GROUP_HPP
#define VETSCAN_TASK_GROUP_HPP

#include "errors.hpp"
#include "thread_pool.hpp"
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <stop_token>
#include <type_traits>
#include <vector>

namespace vetscan {

/**
 * @brief A set of tasks running on a shared ThreadPool, joined as a unit.
 *
 * @details Every task receives the group's stop token. The first task that
 * throws requests stop on the group, so siblings that have not started yet
 * are cancelled and running ones can observe the token. join() waits for
 * every task to settle and then either rethrows that first failure or returns
 * the results in spawn order, independent of completion order.
 *
 * A parent token (e.g. the caller's cancellation) can be linked at
 * construction; stopping it stops the group.
 *
 * @tparam T Result type of a single task. Must not be void.
 */
template <typename T>
class TaskGroup {
    static_assert(!std::is_void_v<T>, "TaskGroup tasks must return their slice");

public:
    explicit TaskGroup(ThreadPool& pool, const std::stop_token& parent = {})
        : pool_(pool) {
        if (parent.stop_possible()) {
            parent_link_.emplace(parent, std::function<void()>([this] { stop_.request_stop(); }));
        }
    }

    ~TaskGroup() {
        cancel();
        settle();
    }

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /**
     * @brief Schedule a task.
     * @param fn Callable `T(std::stop_token)`.
     */
    template <class F>
    void spawn(F&& fn) {
        futures_.push_back(pool_.enqueue(
            [this, task = std::forward<F>(fn)](const std::stop_token& worker_st) mutable -> T {
                try {
                    if (stop_.stop_requested() || worker_st.stop_requested()) {
                        throw CancelledError("task cancelled before start");
                    }
                    return task(stop_.get_token());
                } catch (...) {
                    record_failure(std::current_exception());
                    throw;
                }
            }));
    }

    /// @brief Request stop for every task of the group.
    void cancel() noexcept { stop_.request_stop(); }

    [[nodiscard]] std::stop_token token() const noexcept { return stop_.get_token(); }

    /**
     * @brief Wait for all tasks.
     * @return Results in spawn order.
     * @throws The first failure recorded by any task.
     */
    std::vector<T> join() {
        settle();
        {
            std::lock_guard lock(mtx_);
            if (first_error_) {
                futures_.clear();
                std::rethrow_exception(first_error_);
            }
        }
        std::vector<T> results;
        results.reserve(futures_.size());
        for (auto& f : futures_) {
            results.push_back(f.get());
        }
        futures_.clear();
        return results;
    }

private:
    void settle() noexcept {
        for (auto& f : futures_) {
            if (f.valid()) f.wait();
        }
    }

    void record_failure(std::exception_ptr error) {
        {
            std::lock_guard lock(mtx_);
            if (!first_error_) first_error_ = std::move(error);
        }
        stop_.request_stop();
    }

    ThreadPool& pool_;
    std::stop_source stop_;
    std::optional<std::stop_callback<std::function<void()>>> parent_link_;
    std::vector<std::future<T>> futures_;
    std::mutex mtx_;
    std::exception_ptr first_error_;
};

} // namespace vetscan

#endif // VETSCAN_TASK_GROUP_HPP
