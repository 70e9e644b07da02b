/**
 * @file thread_pool.hpp
 * @brief std::jthread-based backing executor for one pipeline stage.
 */

#pragma once

#include "core/types.hpp"
#include "executor/tracing_aware_executor.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cluster_exec {

/**
 * @brief Fixed set of named workers draining a FIFO queue.
 *
 * With a non-zero queue capacity, submitters block while the queue is full.
 * shutdown() drains the queue before joining; shutdown_now() discards
 * whatever has not started. Neither may be called from a worker thread.
 */
class ThreadPoolExecutor : public AbstractTracingAwareExecutor {
public:
    ThreadPoolExecutor(std::string name,
                       size_t num_threads,
                       size_t queue_capacity,
                       Logger& logger);
    ~ThreadPoolExecutor() override;

    /// Stop accepting tasks, run those already queued, join the workers.
    void shutdown();

    /// Stop accepting tasks, drop those not yet started, join the workers.
    /// Returns the number of tasks dropped.
    size_t shutdown_now();

    [[nodiscard]] bool is_shutdown() const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const;
    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] uint64_t completed_count() const noexcept;
    [[nodiscard]] ExecutorStats stats() const;

protected:
    void add_task(TaskPtr task) override;
    void on_completion() noexcept override;

private:
    void worker_loop(std::stop_token stop, size_t index);
    void join_workers();

    std::string name_;
    size_t capacity_;
    std::deque<TaskPtr> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any not_empty_;
    std::condition_variable not_full_;
    bool accepting_{true};
    std::atomic<size_t> active_tasks_{0};
    std::atomic<uint64_t> completed_tasks_{0};
    std::vector<std::jthread> workers_;
};

}  // namespace cluster_exec
