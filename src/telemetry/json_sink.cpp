/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace lab_alloc {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                            const std::string& prefix,
                            uint32_t max_file_size_mb,
                            uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(std::max<uint32_t>(max_files, 1)) {
    std::filesystem::create_directories(log_dir_);
    auto path = current_path();
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        current_size_ = std::filesystem::file_size(path, ec);
        if (ec) current_size_ = 0;
    }
    current_file_.open(path, std::ios::app);
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

std::filesystem::path JsonFileSink::rotated_path(uint32_t index) const {
    return log_dir_ / (prefix_ + "." + std::to_string(index) + ".ndjson");
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
    std::error_code ec;
    if (max_files_ == 1) {
        std::filesystem::remove(current_path(), ec);
    } else {
        // Shift <prefix>.i -> <prefix>.i+1; the oldest is overwritten.
        for (uint32_t i = max_files_ - 1; i >= 1; --i) {
            auto from = (i == 1) ? current_path() : rotated_path(i - 1);
            if (std::filesystem::exists(from, ec)) {
                std::filesystem::rename(from, rotated_path(i), ec);
            }
        }
    }
    current_file_.open(current_path(), std::ios::trunc);
    current_size_ = 0;
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

// ── MemorySink ───────────────────────────────

void MemorySink::write(std::string_view json_line) {
    std::lock_guard lock(mutex_);
    lines_.emplace_back(json_line);
}

std::vector<std::string> MemorySink::lines() const {
    std::lock_guard lock(mutex_);
    return lines_;
}

bool MemorySink::contains(std::string_view fragment) const {
    std::lock_guard lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(), [&](const std::string& line) {
        return line.find(fragment) != std::string::npos;
    });
}

void MemorySink::clear() {
    std::lock_guard lock(mutex_);
    lines_.clear();
}

// ── Factory ──────────────────────────────────

Result<std::unique_ptr<ILogSink>> make_log_sink(const TelemetryConfig& config,
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
            return Error{ErrorCode::InvalidArgument,
                         std::string{"Cannot open log directory: "} + err.what()};
        }
    }
    return Error{ErrorCode::InvalidArgument, "Unknown telemetry sink: " + config.sink};
}

}  // namespace lab_alloc
