/**
 * @file errors.cpp
 * @brief Exception helpers.
 */

#include "core/errors.hpp"

namespace cluster_exec {

ExecutionError::ExecutionError(std::exception_ptr cause)
    : ExecutorError(ErrorCode::ExecutionFailed, "Execution failed: " + describe(cause))
    , cause_(std::move(cause)) {}

std::string describe(const std::exception_ptr& cause) {
    if (!cause) return "no exception";
    try {
        std::rethrow_exception(cause);
    } catch (const ExecutorError& e) {
        return std::string{to_string(e.code())} + ": " + e.what();
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

}  // namespace cluster_exec
