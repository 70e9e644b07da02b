/**
 * @file trace_state.cpp
 * @brief TraceState and Tracing implementation.
 */

#include "tracing/trace_state.hpp"
#include "core/logger.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace cluster_exec {

namespace {

thread_local TraceStatePtr t_current;

SessionId random_session_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << rng() << std::setw(16) << rng();
    return oss.str();
}

}  // namespace

// ── TraceState ───────────────────────────────

TraceState::TraceState(SessionId session_id, std::string coordinator)
    : session_id_(std::move(session_id))
    , coordinator_(std::move(coordinator))
    , started_at_(std::chrono::steady_clock::now()) {}

Duration TraceState::elapsed() const {
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started_at_);
}

void TraceState::trace(std::string_view message) {
    TraceEvent event{current_thread_name(), std::string{message}, elapsed()};
    std::lock_guard lock(mutex_);
    events_.push_back(std::move(event));
}

std::vector<TraceEvent> TraceState::events() const {
    std::lock_guard lock(mutex_);
    return events_;
}

// ── Tracing ──────────────────────────────────

TraceStatePtr Tracing::current() {
    return t_current;
}

TraceStatePtr Tracing::set(TraceStatePtr state) {
    std::swap(t_current, state);
    return state;
}

bool Tracing::is_tracing() {
    return t_current != nullptr;
}

void Tracing::trace(std::string_view message) {
    if (t_current) t_current->trace(message);
}

TraceStatePtr Tracing::begin(std::string coordinator) {
    auto state = std::make_shared<TraceState>(random_session_id(), std::move(coordinator));
    set(state);
    return state;
}

}  // namespace cluster_exec
