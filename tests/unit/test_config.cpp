/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace lab_alloc;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "lab_alloc_test_config";
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
    EXPECT_EQ(config.failed_device_table.max_init_failures_before_fail, 3u);
    EXPECT_EQ(config.failed_device_table.cleanup_interval, std::chrono::minutes(15));
    EXPECT_EQ(config.diagnostic.max_query_device_count, 20u);
    EXPECT_EQ(config.diagnostic.max_candidate_types, 30u);
    EXPECT_EQ(config.diagnostic.min_start_timeout, std::chrono::seconds(60));
    EXPECT_EQ(config.telemetry.sink, "stdout");
    EXPECT_EQ(config.telemetry.log_level, "info");
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [failed_device_table]
        max_init_failures_before_fail = 5
        cleanup_interval_sec = 60

        [diagnostic]
        max_query_device_count = 10
        max_candidate_types = 4
        min_start_timeout_sec = 120

        [telemetry]
        sink = "file"
        log_dir = "/tmp/lab_alloc_logs"
        max_file_size_mb = 8
        rotate_count = 2
        log_level = "debug"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.failed_device_table.max_init_failures_before_fail, 5u);
    EXPECT_EQ(config.failed_device_table.cleanup_interval, std::chrono::seconds(60));
    EXPECT_EQ(config.diagnostic.max_query_device_count, 10u);
    EXPECT_EQ(config.diagnostic.max_candidate_types, 4u);
    EXPECT_EQ(config.diagnostic.min_start_timeout, std::chrono::seconds(120));
    EXPECT_EQ(config.telemetry.sink, "file");
    EXPECT_EQ(config.telemetry.log_dir, std::filesystem::path("/tmp/lab_alloc_logs"));
    EXPECT_EQ(config.telemetry.max_file_size_mb, 8u);
    EXPECT_EQ(config.telemetry.rotate_count, 2u);
    EXPECT_EQ(config.telemetry.log_level, "debug");
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [failed_device_table]
        max_init_failures_before_fail = 1
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->failed_device_table.max_init_failures_before_fail, 1u);
    // Defaults for everything else
    EXPECT_EQ(result->failed_device_table.cleanup_interval, std::chrono::minutes(15));
    EXPECT_EQ(result->diagnostic.max_query_device_count, 20u);
}

TEST_F(ConfigTest, RejectsZeroThreshold) {
    auto path = write_toml(R"(
        [failed_device_table]
        max_init_failures_before_fail = 0
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, RejectsZeroCleanupInterval) {
    auto path = write_toml(R"(
        [failed_device_table]
        cleanup_interval_sec = 0
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, RejectsNegativeDiagnosticLimits) {
    for (const char* key : {"max_query_device_count", "max_candidate_types", "min_start_timeout_sec"}) {
        auto path = write_toml(std::string{"[diagnostic]\n"} + key + " = -1\n");
        auto result = load_config(path);
        ASSERT_FALSE(result.has_value()) << key;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument) << key;
        EXPECT_NE(result.error().message.find(key), std::string::npos) << key;
    }
}

TEST_F(ConfigTest, ZeroQueryDeviceCountIsAllowed) {
    auto path = write_toml(R"(
        [diagnostic]
        max_query_device_count = 0
    )");
    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->diagnostic.max_query_device_count, 0u);
}

TEST_F(ConfigTest, RejectsOutOfRangeTelemetrySizes) {
    auto path = write_toml(R"(
        [telemetry]
        max_file_size_mb = -5
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);

    auto rotate_path = write_toml(R"(
        [telemetry]
        rotate_count = 0
    )");
    auto rotate = load_config(rotate_path);
    ASSERT_FALSE(rotate.has_value());
    EXPECT_EQ(rotate.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
}
