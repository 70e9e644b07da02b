/**
 * @file tracing_aware_executor.cpp
 * @brief AbstractTracingAwareExecutor implementation.
 */

#include "executor/tracing_aware_executor.hpp"

#include <cstdio>
#include <exception>

namespace cluster_exec {

void AbstractTracingAwareExecutor::execute(std::function<void()> command) {
    add_task(new_task_for<void>(std::move(command), Tracing::current()));
}

void AbstractTracingAwareExecutor::execute(std::function<void()> command, TraceStatePtr state) {
    add_task(new_task_for<void>(std::move(command), std::move(state)));
}

void AbstractTracingAwareExecutor::task_failed(const std::exception_ptr& cause) noexcept {
    failed_.fetch_add(1, std::memory_order_relaxed);
    try {
        logger_.warn("Uncaught exception on thread " + current_thread_name() + ": " + describe(cause));
    } catch (const std::exception& e) {
        // The worker must survive a broken sink; report on stderr instead.
        std::fprintf(stderr, "Could not log task failure: %s\n", e.what());
    }
}

void AbstractTracingAwareExecutor::task_completed() noexcept {
    on_completion();
}

}  // namespace cluster_exec
