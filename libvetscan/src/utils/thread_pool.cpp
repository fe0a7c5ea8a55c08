#include "../../include/thread_pool.hpp"

namespace vetscan {

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
    }
}

void ThreadPool::worker_loop(const std::stop_token& st) {
    for (;;) {
        std::function<void(std::stop_token)> task;
        {
            std::unique_lock lock(queue_mutex_);
            condition_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return; // stopping and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        // packaged_task stores any exception in its future
        task(st);
    }
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock lock(queue_mutex_);
        stopping_ = true;
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    // jthread joins on destruction
}

} // namespace vetscan
