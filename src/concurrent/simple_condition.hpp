/**
 * @file simple_condition.hpp
 * @brief Single-shot condition used to publish task completion.
 *
 * Once signal_all() has been called the condition stays signaled: every
 * current waiter is released and every later await returns immediately.
 * Writes made before signal_all() happen-before the return of any await
 * and any is_signaled() that observes true.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace cluster_exec {

class SimpleCondition {
public:
    SimpleCondition() = default;

    SimpleCondition(const SimpleCondition&) = delete;
    SimpleCondition& operator=(const SimpleCondition&) = delete;

    /// Block until signaled.
    void await();

    /// Block until signaled or until @p timeout elapses. Returns false on timeout.
    template <typename Rep, typename Period>
    [[nodiscard]] bool await_for(std::chrono::duration<Rep, Period> timeout) {
        return await_until(std::chrono::steady_clock::now() + timeout);
    }

    /// Block until signaled or @p deadline passes. Returns false on timeout.
    template <typename Clock, typename Duration>
    [[nodiscard]] bool await_until(std::chrono::time_point<Clock, Duration> deadline) {
        if (is_signaled()) return true;
        std::unique_lock lock(mutex_);
        return cv_.wait_until(lock, deadline, [this] {
            return signaled_.load(std::memory_order_relaxed);
        });
    }

    /// Mark signaled and wake every waiter. Idempotent.
    void signal_all();

    [[nodiscard]] bool is_signaled() const noexcept {
        return signaled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> signaled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace cluster_exec
