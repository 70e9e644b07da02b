/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <string_view>

namespace cluster_exec {

namespace {

Result<void> validate(const Config& config) {
    if (auto level = parse_log_level(config.logging.level); !level) {
        return level.error();
    }
    const auto& sink = config.logging.sink;
    if (sink != "stdout" && sink != "file" && sink != "null") {
        return Error{ErrorCode::InvalidConfig, "Unknown log sink: " + sink};
    }
    if (config.executor.name.empty()) {
        return Error{ErrorCode::InvalidConfig, "Executor name must not be empty"};
    }
    return {};
}

/// Read a non-negative 32-bit count; negative or oversized values are invalid.
template <typename Table>
Result<uint32_t> read_count(Table table, std::string_view key, int64_t fallback) {
    const int64_t value = table[key].value_or(fallback);
    if (value < 0 || value > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{key} + " must be a non-negative 32-bit count, got "
                         + std::to_string(value)};
    }
    return static_cast<uint32_t>(value);
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.name = executor["name"].value_or(std::string{"request-stage"});
            auto thread_count = read_count(executor, "thread_count", 0);
            if (!thread_count) return thread_count.error();
            config.executor.thread_count = *thread_count;

            auto queue_capacity = read_count(executor, "queue_capacity", 0);
            if (!queue_capacity) return queue_capacity.error();
            config.executor.queue_capacity = *queue_capacity;
        }

        // [logging]
        if (auto logging = tbl["logging"]; logging.is_table()) {
            config.logging.level = logging["level"].value_or(std::string{"info"});
            config.logging.sink = logging["sink"].value_or(std::string{"stdout"});
            config.logging.log_dir = logging["log_dir"].value_or(std::string{"./logs"});
            auto max_file_size_mb = read_count(logging, "max_file_size_mb", 50);
            if (!max_file_size_mb) return max_file_size_mb.error();
            config.logging.max_file_size_mb = *max_file_size_mb;

            auto rotate_count = read_count(logging, "rotate_count", 5);
            if (!rotate_count) return rotate_count.error();
            config.logging.rotate_count = *rotate_count;
        }

        // [tracing]
        if (auto tracing = tbl["tracing"]; tracing.is_table()) {
            config.tracing.enabled = tracing["enabled"].value_or(true);
            config.tracing.node = tracing["node"].value_or(std::string{"node-01"});
        }

        if (auto valid = validate(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace cluster_exec
