/**
 * @file config.hpp
 * @brief Executor node configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace cluster_exec {

struct ExecutorConfig {
    std::string name = "request-stage";
    uint32_t thread_count = 0;          ///< 0 = hardware_concurrency
    uint32_t queue_capacity = 0;        ///< 0 = unbounded
};

struct LoggingConfig {
    std::string level = "info";
    std::string sink = "stdout";        ///< "stdout", "file", "null"
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

struct TracingConfig {
    bool enabled = true;
    std::string node = "node-01";       ///< Coordinator name recorded in new sessions
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    ExecutorConfig executor;
    LoggingConfig logging;
    TracingConfig tracing;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults; unknown log levels or sink kinds are
 * reported as ErrorCode::InvalidConfig.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace cluster_exec
