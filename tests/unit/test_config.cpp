/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace cluster_exec;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ce_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.executor.name, "request-stage");
    EXPECT_EQ(config.executor.thread_count, 0u);
    EXPECT_EQ(config.executor.queue_capacity, 0u);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.logging.sink, "stdout");
    EXPECT_TRUE(config.tracing.enabled);
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [executor]
        name = "mutation-stage"
        thread_count = 8
        queue_capacity = 1024

        [logging]
        level = "debug"
        sink = "file"
        log_dir = "/tmp/ce_logs"
        max_file_size_mb = 10
        rotate_count = 3

        [tracing]
        enabled = false
        node = "node-07"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.executor.name, "mutation-stage");
    EXPECT_EQ(config.executor.thread_count, 8u);
    EXPECT_EQ(config.executor.queue_capacity, 1024u);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.sink, "file");
    EXPECT_EQ(config.logging.log_dir, std::filesystem::path{"/tmp/ce_logs"});
    EXPECT_EQ(config.logging.max_file_size_mb, 10u);
    EXPECT_EQ(config.logging.rotate_count, 3u);
    EXPECT_FALSE(config.tracing.enabled);
    EXPECT_EQ(config.tracing.node, "node-07");
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [executor]
        thread_count = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->executor.thread_count, 2u);
    // Defaults for everything else
    EXPECT_EQ(result->executor.name, "request-stage");
    EXPECT_EQ(result->logging.level, "info");
}

TEST_F(ConfigTest, UnknownLogLevelRejected) {
    auto path = write_toml(R"(
        [logging]
        level = "verbose"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
}

TEST_F(ConfigTest, UnknownSinkRejected) {
    auto path = write_toml(R"(
        [logging]
        sink = "syslog"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
}

TEST_F(ConfigTest, NegativeCountsRejected) {
    const char* cases[] = {
        "[executor]\nthread_count = -1\n",
        "[executor]\nqueue_capacity = -5\n",
        "[logging]\nrotate_count = -1\n",
        "[logging]\nmax_file_size_mb = -10\n",
    };
    for (const char* content : cases) {
        auto result = load_config(write_toml(content));
        ASSERT_FALSE(result.has_value()) << content;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig) << content;
    }
}

TEST_F(ConfigTest, OversizedCountRejected) {
    auto path = write_toml(R"(
        [executor]
        thread_count = 4294967296
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
    EXPECT_NE(result.error().message.find("thread_count"), std::string::npos);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    EXPECT_FALSE(result.has_value());
}
