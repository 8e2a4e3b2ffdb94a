/**
 * @file failed_device_table.hpp
 * @brief Time-windowed quarantine table of devices that keep failing init.
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/periodic_task.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace lab_alloc {

/**
 * @brief Last failure time and cumulative failure count of one device.
 */
struct FailedDeviceEntryInfo {
    Timestamp last_failed_time;
    uint32_t failure_count{0};
};

/**
 * @brief Records device init failures and answers "is this device
 *        quarantined".
 *
 * A device is failed once its count reaches max_init_failures_before_fail and
 * stays failed for kTimeToStayFailed after its last failure. Entries below
 * the threshold are forgotten after kEntryExpirationTime without failures.
 *
 * One instance is created at process start and shared by reference with
 * every allocation-path consumer. All methods take the single table mutex.
 * A background task purges expired entries every cleanup_interval once the
 * first failure is recorded; queries re-check expiry themselves and never
 * depend on it having run.
 */
class FailedDeviceTable {
public:
    static constexpr std::chrono::minutes kEntryExpirationTime{10};
    static constexpr std::chrono::minutes kTimeToStayFailed{20};

    FailedDeviceTable(const FailedDeviceTableConfig& config, const IClock& clock, Logger& logger);
    ~FailedDeviceTable();

    FailedDeviceTable(const FailedDeviceTable&) = delete;
    FailedDeviceTable& operator=(const FailedDeviceTable&) = delete;

    /// Records one init failure of @p control_id.
    void add(const ControlId& control_id);

    /// Clears the failure history, e.g. after a successful init.
    void remove(const ControlId& control_id);

    [[nodiscard]] bool has(const ControlId& control_id);

    /// Ids currently quarantined. Purges expired entries first.
    [[nodiscard]] std::unordered_set<ControlId> failed_device_ids();

    /// Failures counted for a live entry, 0 if absent or expired.
    [[nodiscard]] uint32_t failure_count(const ControlId& control_id) const;

    /// Entries physically held, expired ones included until purged.
    [[nodiscard]] size_t entry_count() const;

    [[nodiscard]] bool cleanup_task_running() const;
    [[nodiscard]] uint32_t max_init_failures_before_fail() const noexcept { return threshold_; }

private:
    [[nodiscard]] bool is_failed(const FailedDeviceEntryInfo& entry) const noexcept;
    [[nodiscard]] bool is_expired(const FailedDeviceEntryInfo& entry, Timestamp now) const noexcept;
    size_t cleanup_locked(Timestamp now);
    void run_cleanup();

    const uint32_t threshold_;
    const std::chrono::milliseconds cleanup_interval_;
    const IClock& clock_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::unordered_map<ControlId, FailedDeviceEntryInfo> entries_;
    std::unique_ptr<PeriodicTask> cleanup_task_;
};

}  // namespace lab_alloc
