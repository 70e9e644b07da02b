/**
 * @file simple_condition.cpp
 * @brief SimpleCondition implementation.
 */

#include "concurrent/simple_condition.hpp"

namespace cluster_exec {

void SimpleCondition::await() {
    if (is_signaled()) return;
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return signaled_.load(std::memory_order_relaxed); });
}

void SimpleCondition::signal_all() {
    {
        std::lock_guard lock(mutex_);
        signaled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

}  // namespace cluster_exec
