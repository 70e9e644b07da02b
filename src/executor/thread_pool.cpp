/**
 * @file thread_pool.cpp
 * @brief ThreadPoolExecutor implementation.
 */

#include "executor/thread_pool.hpp"

namespace cluster_exec {

ThreadPoolExecutor::ThreadPoolExecutor(std::string name,
                                       size_t num_threads,
                                       size_t queue_capacity,
                                       Logger& logger)
    : AbstractTracingAwareExecutor(logger)
    , name_(std::move(name))
    , capacity_(queue_capacity) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this, i](std::stop_token stop) {
            worker_loop(stop, i);
        });
    }
    this->logger().debug("Executor " + name_ + " started with "
                         + std::to_string(num_threads) + " threads");
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    shutdown();
}

void ThreadPoolExecutor::add_task(TaskPtr task) {
    {
        std::unique_lock lock(queue_mutex_);
        if (capacity_ > 0) {
            not_full_.wait(lock, [this] {
                return !accepting_ || task_queue_.size() < capacity_;
            });
        }
        if (!accepting_) {
            throw RejectedExecutionError("Executor " + name_ + " is shut down");
        }
        task_queue_.push_back(std::move(task));
    }
    not_empty_.notify_one();
}

void ThreadPoolExecutor::on_completion() noexcept {
    active_tasks_.fetch_sub(1, std::memory_order_acq_rel);
    completed_tasks_.fetch_add(1, std::memory_order_acq_rel);
}

void ThreadPoolExecutor::worker_loop(std::stop_token stop, size_t index) {
    if (!set_current_thread_name(name_ + "-" + std::to_string(index))) {
        logger().debug("Could not name worker " + std::to_string(index) + " of " + name_);
    }

    while (true) {
        TaskPtr task;
        {
            std::unique_lock lock(queue_mutex_);
            not_empty_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            // Stop requested and nothing left to drain.
            if (task_queue_.empty()) return;

            task = std::move(task_queue_.front());
            task_queue_.pop_front();
        }
        not_full_.notify_one();

        active_tasks_.fetch_add(1, std::memory_order_acq_rel);
        task->run();
    }
}

void ThreadPoolExecutor::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        accepting_ = false;
    }
    not_full_.notify_all();
    join_workers();
}

size_t ThreadPoolExecutor::shutdown_now() {
    size_t dropped = 0;
    {
        std::lock_guard lock(queue_mutex_);
        accepting_ = false;
        dropped = task_queue_.size();
        task_queue_.clear();
    }
    not_full_.notify_all();
    join_workers();
    if (dropped > 0) {
        logger().info("Executor " + name_ + " dropped " + std::to_string(dropped)
                      + " queued tasks at shutdown");
    }
    return dropped;
}

void ThreadPoolExecutor::join_workers() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    // Wake idle workers so they can observe the stop request.
    not_empty_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

bool ThreadPoolExecutor::is_shutdown() const {
    std::lock_guard lock(queue_mutex_);
    return !accepting_;
}

size_t ThreadPoolExecutor::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPoolExecutor::queued_count() const {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPoolExecutor::thread_count() const noexcept {
    return workers_.size();
}

uint64_t ThreadPoolExecutor::completed_count() const noexcept {
    return completed_tasks_.load();
}

ExecutorStats ThreadPoolExecutor::stats() const {
    return ExecutorStats{
        .threads = thread_count(),
        .active = active_count(),
        .pending = queued_count(),
        .completed = completed_count(),
        .failed = failed_count()
    };
}

}  // namespace cluster_exec
