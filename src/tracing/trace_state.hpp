/**
 * @file trace_state.hpp
 * @brief Per-request trace sessions and the thread-local ambient slot.
 *
 * A TraceState identifies one diagnostic session. The executor only moves
 * TraceState handles between threads: it captures the submitter's ambient
 * session and installs it on the worker for the duration of a task.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cluster_exec {

/**
 * @brief One event recorded in a trace session.
 */
struct TraceEvent {
    std::string thread;
    std::string message;
    Duration elapsed{0};       ///< Since the session started
};

/**
 * @brief A trace session. Shared between the threads working on one request.
 */
class TraceState {
public:
    TraceState(SessionId session_id, std::string coordinator);

    TraceState(const TraceState&) = delete;
    TraceState& operator=(const TraceState&) = delete;

    [[nodiscard]] const SessionId& session_id() const noexcept { return session_id_; }
    [[nodiscard]] const std::string& coordinator() const noexcept { return coordinator_; }
    [[nodiscard]] Duration elapsed() const;

    /// Append an event stamped with the calling thread. Thread-safe.
    void trace(std::string_view message);

    /// Snapshot of the recorded events, in recording order.
    [[nodiscard]] std::vector<TraceEvent> events() const;

private:
    SessionId session_id_;
    std::string coordinator_;
    SteadyTime started_at_;
    mutable std::mutex mutex_;
    std::vector<TraceEvent> events_;
};

using TraceStatePtr = std::shared_ptr<TraceState>;

/**
 * @brief Access to the calling thread's ambient trace session.
 */
class Tracing {
public:
    Tracing() = delete;

    /// Session active on this thread, or null.
    [[nodiscard]] static TraceStatePtr current();

    /// Replace this thread's session; returns the previous one.
    static TraceStatePtr set(TraceStatePtr state);

    [[nodiscard]] static bool is_tracing();

    /// Record @p message in the ambient session, if any.
    static void trace(std::string_view message);

    /// Start a new session on this thread with a random id.
    static TraceStatePtr begin(std::string coordinator);
};

/**
 * @brief Installs a trace session on the current thread for the lifetime of
 *        the scope, then restores whatever was there before.
 */
class TraceScope {
public:
    explicit TraceScope(TraceStatePtr state)
        : previous_(Tracing::set(std::move(state))) {}

    ~TraceScope() { Tracing::set(std::move(previous_)); }

    TraceScope(const TraceScope&) = delete;
    TraceScope& operator=(const TraceScope&) = delete;

private:
    TraceStatePtr previous_;
};

}  // namespace cluster_exec
