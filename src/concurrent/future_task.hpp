/**
 * @file future_task.hpp
 * @brief Lightweight future wrapping one unit of work.
 *
 * A FutureTask owns a body and a single result slot. The worker that runs it
 * is the only writer of the slot; completion is published exclusively through
 * a SimpleCondition, so any thread returning from get() sees a fully written
 * outcome. Cancellation is deliberately unsupported: once handed to an
 * executor a task runs to completion or never runs at all.
 */

#pragma once

#include "concurrent/simple_condition.hpp"
#include "core/errors.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cluster_exec {

/**
 * @brief Receives per-task notifications on the worker thread.
 *
 * Implemented by the executor. Both callbacks may run concurrently on
 * distinct workers, each for its own task.
 */
class TaskListener {
public:
    virtual ~TaskListener() = default;

    /// A task body threw; @p cause is already stored in the task.
    virtual void task_failed(const std::exception_ptr& cause) noexcept = 0;

    /// A task finished (either way); its outcome is readable and signaled.
    virtual void task_completed() noexcept = 0;
};

/**
 * @brief Type-erased unit of work as seen by a backing executor.
 */
class Task {
public:
    virtual ~Task() = default;

    /// Execute the task. Never throws.
    virtual void run() = 0;

    [[nodiscard]] virtual bool is_done() const noexcept = 0;
};

using TaskPtr = std::shared_ptr<Task>;

/**
 * @brief Single-assignment future tied to a body of type T().
 */
template <typename T>
class FutureTask : public Task {
public:
    using Callable = std::function<T()>;

    FutureTask(Callable callable, TaskListener& listener)
        : callable_(std::move(callable)), listener_(&listener) {}

    FutureTask(const FutureTask&) = delete;
    FutureTask& operator=(const FutureTask&) = delete;

    void run() override;

    /// Block until done, then return a copy of the value or throw ExecutionError.
    T get() {
        done_.await();
        return report();
    }

    /// As get(), but throw TimeoutError if @p timeout elapses first.
    template <typename Rep, typename Period>
    T get(std::chrono::duration<Rep, Period> timeout) {
        if (!done_.await_for(timeout)) {
            throw TimeoutError("Task did not complete within "
                + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count())
                + "ms");
        }
        return report();
    }

    /// Tasks cannot be cancelled.
    bool cancel(bool /*may_interrupt*/) noexcept { return false; }
    [[nodiscard]] bool is_cancelled() const noexcept { return false; }

    [[nodiscard]] bool is_done() const noexcept override { return done_.is_signaled(); }

    [[nodiscard]] bool is_failed() const noexcept {
        return done_.is_signaled() && outcome_.index() == kFailure;
    }

    /// True once run() has been entered, even if the body is still running.
    [[nodiscard]] bool is_started() const noexcept {
        return started_.load(std::memory_order_acquire);
    }

    /// True if completion of this task is reported to @p listener.
    [[nodiscard]] bool reports_to(const TaskListener& listener) const noexcept {
        return listener_ == &listener;
    }

    /**
     * @brief Record the hand-off to an executor.
     *
     * Returns false if the task was handed off before; an executor must then
     * refuse it, as run() would not report a second completion.
     */
    bool mark_submitted() noexcept {
        return !submitted_.exchange(true, std::memory_order_acq_rel);
    }

private:
    using Value = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    static constexpr std::size_t kEmpty = 0;
    static constexpr std::size_t kSuccess = 1;
    static constexpr std::size_t kFailure = 2;

    T report() const {
        if (outcome_.index() == kFailure) {
            throw ExecutionError(std::get<kFailure>(outcome_));
        }
        if constexpr (std::is_void_v<T>) {
            return;
        } else {
            return std::get<kSuccess>(outcome_);
        }
    }

    Callable callable_;
    TaskListener* listener_;
    std::variant<std::monostate, Value, std::exception_ptr> outcome_;
    std::atomic<bool> started_{false};
    std::atomic<bool> submitted_{false};
    SimpleCondition done_;
};

template <typename T>
using FutureTaskPtr = std::shared_ptr<FutureTask<T>>;

template <typename T>
void FutureTask<T>::run() {
    // The slot has a single writer; a repeated run() leaves it untouched.
    if (started_.exchange(true, std::memory_order_acq_rel)) return;

    try {
        if constexpr (std::is_void_v<T>) {
            callable_();
            outcome_.template emplace<kSuccess>();
        } else {
            outcome_.template emplace<kSuccess>(callable_());
        }
    } catch (...) {
        outcome_.template emplace<kFailure>(std::current_exception());
        listener_->task_failed(std::get<kFailure>(outcome_));
    }

    // Release captured state before waking anybody.
    callable_ = nullptr;
    done_.signal_all();
    listener_->task_completed();
}

/**
 * @brief Adapt a runnable plus a fixed result into a Callable.
 */
template <typename T>
typename FutureTask<T>::Callable callable_of(std::function<void()> runnable, T result) {
    return [runnable = std::move(runnable), result = std::move(result)]() -> T {
        runnable();
        return result;
    };
}

}  // namespace cluster_exec
