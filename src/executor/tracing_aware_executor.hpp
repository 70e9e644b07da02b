/**
 * @file tracing_aware_executor.hpp
 * @brief Submission API shared by every backing executor.
 *
 * Normalizes callers' work into FutureTask handles, wrapping them so the
 * submitter's trace session follows the task onto the worker, and hands them
 * to the concrete executor through add_task(). Concrete executors decide
 * where and when a task runs and keep their accounting in on_completion().
 */

#pragma once

#include "concurrent/future_task.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "executor/trace_session_task.hpp"
#include "tracing/trace_state.hpp"

#include <atomic>
#include <chrono>
#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace cluster_exec {

class AbstractTracingAwareExecutor : public TaskListener {
public:
    explicit AbstractTracingAwareExecutor(Logger& logger) : logger_(logger) {}
    ~AbstractTracingAwareExecutor() override = default;

    AbstractTracingAwareExecutor(const AbstractTracingAwareExecutor&) = delete;
    AbstractTracingAwareExecutor& operator=(const AbstractTracingAwareExecutor&) = delete;

    // ── Fire-and-forget ───────────────────────

    /// Run @p command in the submitter's ambient trace session, if any.
    void execute(std::function<void()> command);

    /// Run @p command in an explicitly supplied trace session.
    void execute(std::function<void()> command, TraceStatePtr state);

    // ── Submission ────────────────────────────

    /// Submit a callable; its return value (or void) becomes the task result.
    template <std::invocable F>
    FutureTaskPtr<std::invoke_result_t<F>> submit(F&& func) {
        using R = std::invoke_result_t<F>;
        return submit(new_task_for<R>(typename FutureTask<R>::Callable(std::forward<F>(func)),
                                      Tracing::current()));
    }

    /// Submit a runnable that yields @p result once it has run.
    template <std::invocable F, typename T>
        requires std::is_void_v<std::invoke_result_t<F>>
    FutureTaskPtr<T> submit(F&& runnable, T result) {
        return submit(new_task_for<T>(
            callable_of<T>(std::function<void()>(std::forward<F>(runnable)), std::move(result)),
            Tracing::current()));
    }

    /**
     * @brief Submit an already-built handle.
     *
     * The handle is reused, not re-wrapped, unless a trace session is active
     * and the handle does not already carry one. Throws
     * RejectedExecutionError if the handle reports to another executor or
     * has been submitted before.
     */
    template <typename T>
    FutureTaskPtr<T> submit(FutureTaskPtr<T> task) {
        if (!task->reports_to(*this)) {
            throw RejectedExecutionError("Task is bound to another executor");
        }
        if (task->is_started() || !task->mark_submitted()) {
            throw RejectedExecutionError("Task has already been submitted");
        }
        add_task(task_for(task, Tracing::current()));
        return task;
    }

    // ── Bulk forms (unsupported) ──────────────

    template <typename T>
    [[noreturn]] std::vector<FutureTaskPtr<T>> invoke_all(const std::vector<std::function<T()>>& /*tasks*/) {
        throw UnsupportedOperationError("invoke_all");
    }

    template <typename T, typename Rep, typename Period>
    [[noreturn]] std::vector<FutureTaskPtr<T>> invoke_all(const std::vector<std::function<T()>>& /*tasks*/,
                                                          std::chrono::duration<Rep, Period> /*timeout*/) {
        throw UnsupportedOperationError("invoke_all");
    }

    template <typename T>
    [[noreturn]] T invoke_any(const std::vector<std::function<T()>>& /*tasks*/) {
        throw UnsupportedOperationError("invoke_any");
    }

    template <typename T, typename Rep, typename Period>
    [[noreturn]] T invoke_any(const std::vector<std::function<T()>>& /*tasks*/,
                              std::chrono::duration<Rep, Period> /*timeout*/) {
        throw UnsupportedOperationError("invoke_any");
    }

    /// Number of task bodies that threw since construction.
    [[nodiscard]] uint64_t failed_count() const noexcept { return failed_.load(); }

protected:
    /// Build a handle bound to this executor without submitting it.
    template <typename T>
    FutureTaskPtr<T> new_task_for(typename FutureTask<T>::Callable callable, TraceStatePtr state) {
        if (state) {
            return std::make_shared<TraceSessionFutureTask<T>>(std::move(callable), std::move(state), *this);
        }
        return std::make_shared<FutureTask<T>>(std::move(callable), *this);
    }

    /**
     * @brief Accept @p task for eventual execution.
     *
     * Implementations call task->run() exactly once, or never (e.g. when the
     * task is discarded at shutdown). May throw RejectedExecutionError.
     */
    virtual void add_task(TaskPtr task) = 0;

    /**
     * @brief Called on the worker right after a task finished, once its
     *        outcome is readable. Must tolerate concurrent calls.
     */
    virtual void on_completion() noexcept = 0;

    [[nodiscard]] Logger& logger() noexcept { return logger_; }

private:
    template <typename T>
    TaskPtr task_for(const FutureTaskPtr<T>& task, TraceStatePtr state) {
        if (state && !std::dynamic_pointer_cast<TraceSessionFutureTask<T>>(task)) {
            return std::make_shared<TracedTask>(task, std::move(state));
        }
        return task;
    }

    void task_failed(const std::exception_ptr& cause) noexcept override;
    void task_completed() noexcept override;

    Logger& logger_;
    std::atomic<uint64_t> failed_{0};
};

}  // namespace cluster_exec
