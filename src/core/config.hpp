/**
 * @file config.hpp
 * @brief Library and CLI configuration with TOML deserialization.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace lab_alloc {

struct FailedDeviceTableConfig {
    uint32_t max_init_failures_before_fail = 3;
    std::chrono::milliseconds cleanup_interval = std::chrono::minutes(15);
};

struct DiagnosticConfig {
    uint32_t max_query_device_count = 20;   ///< Narrow re-queries below this many perfect devices
    uint32_t max_candidate_types = 30;      ///< Report truncation
    std::chrono::milliseconds min_start_timeout = std::chrono::seconds(60);
};

struct TelemetryConfig {
    std::string sink = "stdout";            ///< "stdout", "file", "null"
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    FailedDeviceTableConfig failed_device_table;
    DiagnosticConfig diagnostic;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file. Absent keys keep their defaults.
 */
Result<Config> load_config(const std::filesystem::path& path);

Config default_config();

}  // namespace lab_alloc
