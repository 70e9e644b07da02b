/**
 * @file test_tracing.cpp
 * @brief Unit tests for trace sessions and trace-carrying tasks.
 */

#include "executor/trace_session_task.hpp"
#include "tracing/trace_state.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace cluster_exec;

namespace {

class CountingListener : public TaskListener {
public:
    void task_failed(const std::exception_ptr& /*cause*/) noexcept override { ++failures; }
    void task_completed() noexcept override {
        ++completions;
        active_on_completion = Tracing::current();
    }

    int failures{0};
    int completions{0};
    TraceStatePtr active_on_completion;
};

TraceStatePtr make_state(const std::string& id) {
    return std::make_shared<TraceState>(id, "node-test");
}

/// Clears the calling thread's session when a test ends.
class TracingTest : public ::testing::Test {
protected:
    void TearDown() override { Tracing::set(nullptr); }
};

}  // namespace

TEST_F(TracingTest, NoSessionByDefault) {
    EXPECT_EQ(Tracing::current(), nullptr);
    EXPECT_FALSE(Tracing::is_tracing());
    Tracing::trace("dropped silently");
}

TEST_F(TracingTest, SetReturnsPrevious) {
    auto a = make_state("a");
    auto b = make_state("b");

    EXPECT_EQ(Tracing::set(a), nullptr);
    EXPECT_EQ(Tracing::set(b), a);
    EXPECT_EQ(Tracing::current(), b);
}

TEST_F(TracingTest, SessionIsThreadLocal) {
    auto state = make_state("local");
    Tracing::set(state);

    TraceStatePtr seen_elsewhere = state;
    std::thread other([&seen_elsewhere] { seen_elsewhere = Tracing::current(); });
    other.join();

    EXPECT_EQ(seen_elsewhere, nullptr);
    EXPECT_EQ(Tracing::current(), state);
}

TEST_F(TracingTest, ScopeRestoresPreviousSession) {
    auto outer = make_state("outer");
    auto inner = make_state("inner");
    Tracing::set(outer);
    {
        TraceScope scope(inner);
        EXPECT_EQ(Tracing::current(), inner);
    }
    EXPECT_EQ(Tracing::current(), outer);
}

TEST_F(TracingTest, ScopeRestoresOnException) {
    auto outer = make_state("outer");
    Tracing::set(outer);
    try {
        TraceScope scope(make_state("inner"));
        throw std::runtime_error("unwind");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(Tracing::current(), outer);
}

TEST_F(TracingTest, EventsAreRecordedInOrder) {
    auto state = Tracing::begin("node-x");
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->coordinator(), "node-x");
    EXPECT_EQ(state->session_id().size(), 32u);

    Tracing::trace("first");
    Tracing::trace("second");

    auto events = state->events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].message, "first");
    EXPECT_EQ(events[1].message, "second");
    EXPECT_LE(events[0].elapsed, events[1].elapsed);
}

TEST_F(TracingTest, TaskRunsInCapturedSessionAndRestoresWorkerSession) {
    CountingListener listener;
    auto captured = make_state("C");
    auto worker_own = make_state("D");

    TraceStatePtr seen_in_body;
    TraceSessionFutureTask<int> task([&seen_in_body] {
        seen_in_body = Tracing::current();
        return 1;
    }, captured, listener);

    Tracing::set(worker_own);
    task.run();

    EXPECT_EQ(seen_in_body, captured);
    EXPECT_EQ(Tracing::current(), worker_own);
    EXPECT_EQ(task.get(), 1);
    EXPECT_EQ(task.trace_state(), captured);
    // The completion hook runs before the worker's session is restored.
    EXPECT_EQ(listener.active_on_completion, captured);
}

TEST_F(TracingTest, FailingTaskStillRestoresWorkerSession) {
    CountingListener listener;
    auto captured = make_state("C");
    auto worker_own = make_state("D");

    TraceSessionFutureTask<int> task([]() -> int {
        throw std::logic_error("bad");
    }, captured, listener);

    Tracing::set(worker_own);
    task.run();

    EXPECT_EQ(Tracing::current(), worker_own);
    EXPECT_TRUE(task.is_failed());
    EXPECT_EQ(listener.failures, 1);
    EXPECT_THROW(task.get(), ExecutionError);
}

TEST_F(TracingTest, TracedTaskDecoratesExistingHandle) {
    CountingListener listener;
    auto captured = make_state("C");
    auto inner = std::make_shared<FutureTask<int>>([] {
        return Tracing::current() ? 1 : 0;
    }, listener);

    TracedTask traced(inner, captured);
    traced.run();

    EXPECT_TRUE(traced.is_done());
    EXPECT_EQ(inner->get(), 1);
    EXPECT_EQ(listener.completions, 1);
    EXPECT_EQ(Tracing::current(), nullptr);
}
