/**
 * @file log_sinks.cpp
 * @brief Log sink implementations.
 */

#include "logging/log_sinks.hpp"

#include <iostream>
#include <system_error>

namespace cluster_exec {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                           const std::string& prefix,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files) {
    std::filesystem::create_directories(log_dir_);
    open_current();
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::current_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

void JsonFileSink::open_current() {
    auto path = current_path();
    std::error_code ec;
    auto existing = std::filesystem::file_size(path, ec);
    current_size_ = ec ? 0 : existing;
    current_file_.open(path, std::ios::app);
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed();
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed() {
    if (current_size_ < max_file_size_bytes_) return;

    current_file_.close();

    auto numbered = [this](uint32_t index) {
        return log_dir_ / (prefix_ + "." + std::to_string(index) + ".ndjson");
    };

    // Errors here only lose old log files; the active file is reopened regardless.
    std::error_code ec;
    if (max_files_ == 0) {
        std::filesystem::remove(current_path(), ec);
    } else {
        std::filesystem::remove(numbered(max_files_), ec);
        for (uint32_t i = max_files_; i > 1; --i) {
            if (std::filesystem::exists(numbered(i - 1), ec)) {
                std::filesystem::rename(numbered(i - 1), numbered(i), ec);
            }
        }
        std::filesystem::rename(current_path(), numbered(1), ec);
    }

    open_current();
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

// ── MemorySink ───────────────────────────────

MemorySink::MemorySink() : lines_(std::make_shared<std::vector<std::string>>()) {}

void MemorySink::write(std::string_view json_line) {
    lines_->emplace_back(json_line);
}

// ── Factories ────────────────────────────────

Result<std::unique_ptr<ILogSink>> make_sink(const LoggingConfig& config,
                                            const std::string& prefix) {
    if (config.sink == "stdout") {
        return std::unique_ptr<ILogSink>(std::make_unique<StdoutSink>());
    }
    if (config.sink == "null") {
        return std::unique_ptr<ILogSink>(std::make_unique<NullSink>());
    }
    if (config.sink == "file") {
        try {
            return std::unique_ptr<ILogSink>(std::make_unique<JsonFileSink>(
                config.log_dir, prefix, config.max_file_size_mb, config.rotate_count));
        } catch (const std::filesystem::filesystem_error& err) {
            return Error{ErrorCode::InvalidConfig,
                         "Cannot open log directory " + config.log_dir.string() + ": " + err.what()};
        }
    }
    return Error{ErrorCode::InvalidConfig, "Unknown log sink: " + config.sink};
}

Result<std::unique_ptr<Logger>> make_logger(const LoggingConfig& config,
                                            const std::string& prefix) {
    auto level = parse_log_level(config.level);
    if (!level) return level.error();

    auto sink = make_sink(config, prefix);
    if (!sink) return sink.error();

    return std::make_unique<Logger>(std::move(*sink), *level);
}

}  // namespace cluster_exec
