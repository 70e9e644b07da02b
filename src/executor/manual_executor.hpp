/**
 * @file manual_executor.hpp
 * @brief Executor whose queue is drained explicitly by its owner.
 *
 * Event loops can call run_pending() periodically to execute submitted work
 * on their own thread. Tests use it to control exactly when a task runs.
 */

#pragma once

#include "executor/tracing_aware_executor.hpp"

#include <atomic>
#include <mutex>
#include <vector>

namespace cluster_exec {

class ManualExecutor : public AbstractTracingAwareExecutor {
public:
    explicit ManualExecutor(Logger& logger) : AbstractTracingAwareExecutor(logger) {}

    /// Run every task queued so far on the calling thread. Returns how many ran.
    size_t run_pending();

    /// Drop queued tasks without running them. Returns how many were dropped.
    size_t discard_pending();

    [[nodiscard]] size_t pending_count() const;
    [[nodiscard]] uint64_t completed_count() const noexcept { return completed_.load(); }

protected:
    void add_task(TaskPtr task) override;
    void on_completion() noexcept override;

private:
    std::vector<TaskPtr> queue_;
    mutable std::mutex queue_mutex_;
    std::atomic<uint64_t> completed_{0};
};

}  // namespace cluster_exec
