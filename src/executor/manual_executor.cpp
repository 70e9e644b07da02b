/**
 * @file manual_executor.cpp
 * @brief ManualExecutor implementation.
 */

#include "executor/manual_executor.hpp"

namespace cluster_exec {

void ManualExecutor::add_task(TaskPtr task) {
    std::lock_guard lock(queue_mutex_);
    queue_.push_back(std::move(task));
}

size_t ManualExecutor::run_pending() {
    std::vector<TaskPtr> todo;
    {
        std::lock_guard lock(queue_mutex_);
        std::swap(todo, queue_);
    }
    for (auto& task : todo) {
        task->run();
    }
    return todo.size();
}

size_t ManualExecutor::discard_pending() {
    std::lock_guard lock(queue_mutex_);
    size_t dropped = queue_.size();
    queue_.clear();
    return dropped;
}

size_t ManualExecutor::pending_count() const {
    std::lock_guard lock(queue_mutex_);
    return queue_.size();
}

void ManualExecutor::on_completion() noexcept {
    completed_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace cluster_exec
