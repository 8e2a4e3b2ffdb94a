/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, stdout, in-memory, null.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lab_alloc {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * The live file is <prefix>.ndjson; on overflow it is renamed to
 * <prefix>.1.ndjson and older files shift up, keeping at most max_files.
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

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout. Used by the CLI.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Keeps every line in memory. Thread-safe.
 */
class MemorySink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override {}

    [[nodiscard]] std::vector<std::string> lines() const;
    [[nodiscard]] bool contains(std::string_view fragment) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Builds the sink named by telemetry.sink.
 */
Result<std::unique_ptr<ILogSink>> make_log_sink(const TelemetryConfig& config,
                                                const std::string& prefix);

}  // namespace lab_alloc
