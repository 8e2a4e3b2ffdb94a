/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <format>

namespace lab_alloc {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [failed_device_table]
        if (auto table = tbl["failed_device_table"]; table.is_table()) {
            auto threshold = table["max_init_failures_before_fail"].value_or(int64_t{3});
            if (threshold < 1) {
                return Error{ErrorCode::InvalidArgument,
                             "failed_device_table.max_init_failures_before_fail must be >= 1"};
            }
            config.failed_device_table.max_init_failures_before_fail =
                static_cast<uint32_t>(threshold);
            auto cleanup_sec = table["cleanup_interval_sec"].value_or(int64_t{900});
            if (cleanup_sec < 1) {
                return Error{ErrorCode::InvalidArgument,
                             "failed_device_table.cleanup_interval_sec must be >= 1"};
            }
            config.failed_device_table.cleanup_interval = std::chrono::seconds(cleanup_sec);
        }

        // [diagnostic]
        if (auto diagnostic = tbl["diagnostic"]; diagnostic.is_table()) {
            auto max_query = diagnostic["max_query_device_count"].value_or(int64_t{20});
            auto max_types = diagnostic["max_candidate_types"].value_or(int64_t{30});
            auto min_start_sec = diagnostic["min_start_timeout_sec"].value_or(int64_t{60});
            if (max_query < 0 || max_query > UINT32_MAX) {
                return Error{ErrorCode::InvalidArgument,
                             std::format("diagnostic.max_query_device_count out of range: {}", max_query)};
            }
            if (max_types < 0 || max_types > UINT32_MAX) {
                return Error{ErrorCode::InvalidArgument,
                             std::format("diagnostic.max_candidate_types out of range: {}", max_types)};
            }
            if (min_start_sec < 0) {
                return Error{ErrorCode::InvalidArgument,
                             std::format("diagnostic.min_start_timeout_sec must be >= 0, got {}",
                                         min_start_sec)};
            }
            config.diagnostic.max_query_device_count = static_cast<uint32_t>(max_query);
            config.diagnostic.max_candidate_types = static_cast<uint32_t>(max_types);
            config.diagnostic.min_start_timeout = std::chrono::seconds(min_start_sec);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.sink = telemetry["sink"].value_or(std::string{"stdout"});
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            auto max_file_size_mb = telemetry["max_file_size_mb"].value_or(int64_t{50});
            auto rotate_count = telemetry["rotate_count"].value_or(int64_t{5});
            if (max_file_size_mb < 0 || max_file_size_mb > UINT32_MAX) {
                return Error{ErrorCode::InvalidArgument,
                             std::format("telemetry.max_file_size_mb out of range: {}", max_file_size_mb)};
            }
            if (rotate_count < 1 || rotate_count > UINT32_MAX) {
                return Error{ErrorCode::InvalidArgument,
                             std::format("telemetry.rotate_count must be >= 1, got {}", rotate_count)};
            }
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(max_file_size_mb);
            config.telemetry.rotate_count = static_cast<uint32_t>(rotate_count);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace lab_alloc
