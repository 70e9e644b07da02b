/**
 * @file trace_session_task.hpp
 * @brief Task variants that carry a trace session onto the worker thread.
 */

#pragma once

#include "concurrent/future_task.hpp"
#include "tracing/trace_state.hpp"

#include <memory>
#include <utility>

namespace cluster_exec {

/**
 * @brief FutureTask that runs its body inside a captured trace session.
 *
 * The worker's own session is restored when run() returns, whatever the
 * outcome of the body. Result storage and signaling are those of FutureTask.
 */
template <typename T>
class TraceSessionFutureTask : public FutureTask<T> {
public:
    TraceSessionFutureTask(typename FutureTask<T>::Callable callable,
                           TraceStatePtr state,
                           TaskListener& listener)
        : FutureTask<T>(std::move(callable), listener), state_(std::move(state)) {}

    void run() override {
        TraceScope scope(state_);
        FutureTask<T>::run();
    }

    [[nodiscard]] const TraceStatePtr& trace_state() const noexcept { return state_; }

private:
    TraceStatePtr state_;
};

/**
 * @brief Runs an already-built task inside a trace session.
 *
 * Used when a plain FutureTask is submitted while a session is active: the
 * caller keeps the original handle, and its completion hook still fires once.
 */
class TracedTask : public Task {
public:
    TracedTask(TaskPtr inner, TraceStatePtr state)
        : inner_(std::move(inner)), state_(std::move(state)) {}

    void run() override {
        TraceScope scope(state_);
        inner_->run();
    }

    [[nodiscard]] bool is_done() const noexcept override { return inner_->is_done(); }

    [[nodiscard]] const TraceStatePtr& trace_state() const noexcept { return state_; }
    [[nodiscard]] const TaskPtr& inner() const noexcept { return inner_; }

private:
    TaskPtr inner_;
    TraceStatePtr state_;
};

}  // namespace cluster_exec
