/**
 * @file log_sinks.hpp
 * @brief Log sink implementations: NDJSON files with rotation, stdout, memory, null.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace cluster_exec {

/**
 * @brief Writes NDJSON to size-rotated log files.
 *
 * The active file is `<prefix>.ndjson`; on rotation it becomes
 * `<prefix>.1.ndjson`, older files shift up and anything beyond
 * `max_files` is removed.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    /// Byte threshold override, mostly for tests.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void rotate_if_needed();
    void open_current();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout, useful for development/debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Keeps every line in memory. Shared state lets a test inspect
 *        the lines after handing the sink to a Logger.
 */
class MemorySink : public ILogSink {
public:
    MemorySink();

    void write(std::string_view json_line) override;
    void flush() override {}

    /// Handle to the captured lines; remains valid after the sink is destroyed.
    [[nodiscard]] std::shared_ptr<std::vector<std::string>> lines() const { return lines_; }

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

/**
 * @brief Discards all output, useful for benchmarking.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Build the sink named by the logging configuration.
 */
Result<std::unique_ptr<ILogSink>> make_sink(const LoggingConfig& config,
                                            const std::string& prefix);

/**
 * @brief Build a logger from configuration (sink + level).
 */
Result<std::unique_ptr<Logger>> make_logger(const LoggingConfig& config,
                                            const std::string& prefix);

}  // namespace cluster_exec
