/**
 * @file errors.hpp
 * @brief Exceptions raised to callers retrieving task outcomes.
 *
 * Task bodies never throw across a worker; their failures are stored in the
 * task handle and rethrown here, wrapped, when a caller retrieves the result.
 */

#pragma once

#include "core/result.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace cluster_exec {

/**
 * @brief Base class of every executor-level exception.
 */
class ExecutorError : public std::runtime_error {
public:
    ExecutorError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief A task body failed; carries the original cause.
 */
class ExecutionError : public ExecutorError {
public:
    explicit ExecutionError(std::exception_ptr cause);

    [[nodiscard]] const std::exception_ptr& cause() const noexcept { return cause_; }

    /// Rethrow the original exception raised by the task body.
    [[noreturn]] void rethrow_cause() const { std::rethrow_exception(cause_); }

private:
    std::exception_ptr cause_;
};

/// A bounded retrieval expired before the task completed.
class TimeoutError : public ExecutorError {
public:
    explicit TimeoutError(const std::string& message)
        : ExecutorError(ErrorCode::Timeout, message) {}
};

/// Bulk submission forms are not supported.
class UnsupportedOperationError : public ExecutorError {
public:
    explicit UnsupportedOperationError(const std::string& operation)
        : ExecutorError(ErrorCode::UnsupportedOperation, operation + " is not supported") {}
};

/// The backing executor no longer accepts tasks.
class RejectedExecutionError : public ExecutorError {
public:
    explicit RejectedExecutionError(const std::string& message)
        : ExecutorError(ErrorCode::Rejected, message) {}
};

/**
 * @brief Render an exception_ptr as "<type-ish>: <what>" for diagnostics.
 */
[[nodiscard]] std::string describe(const std::exception_ptr& cause);

}  // namespace cluster_exec
