/**
 * @file failed_device_table.cpp
 * @brief FailedDeviceTable implementation.
 */

#include "device/failed_device_table.hpp"

#include <algorithm>
#include <format>

namespace lab_alloc {

FailedDeviceTable::FailedDeviceTable(const FailedDeviceTableConfig& config,
                                     const IClock& clock,
                                     Logger& logger)
    : threshold_(std::max<uint32_t>(config.max_init_failures_before_fail, 1))
    , cleanup_interval_(config.cleanup_interval > std::chrono::milliseconds::zero()
                            ? config.cleanup_interval
                            : FailedDeviceTableConfig{}.cleanup_interval)
    , clock_(clock)
    , logger_(logger) {}

FailedDeviceTable::~FailedDeviceTable() {
    std::unique_ptr<PeriodicTask> task;
    {
        std::lock_guard lock(mutex_);
        task = std::move(cleanup_task_);
    }
    // Joins outside the lock; the task body takes the same mutex.
    task.reset();
}

void FailedDeviceTable::add(const ControlId& control_id) {
    auto now = clock_.now();
    uint32_t count = 1;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(control_id);
        if (it != entries_.end() && !is_expired(it->second, now)) {
            count = it->second.failure_count + 1;
        }
        entries_[control_id] = FailedDeviceEntryInfo{.last_failed_time = now, .failure_count = count};

        if (!cleanup_task_) {
            cleanup_task_ = std::make_unique<PeriodicTask>(
                "failed-device-table-cleanup",
                cleanup_interval_,
                cleanup_interval_,
                [this] { run_cleanup(); },
                [this](const std::exception& e) {
                    logger_.warn(std::format("Failed device table cleanup failed: {}", e.what()));
                });
            cleanup_task_->start();
        }
    }

    if (count == threshold_) {
        logger_.warn(std::format("Device {} failed init {} times, quarantined", control_id, count));
    } else {
        logger_.debug(std::format("Device {} init failure #{}", control_id, count));
    }
}

void FailedDeviceTable::remove(const ControlId& control_id) {
    std::lock_guard lock(mutex_);
    entries_.erase(control_id);
}

bool FailedDeviceTable::has(const ControlId& control_id) {
    return failed_device_ids().contains(control_id);
}

std::unordered_set<ControlId> FailedDeviceTable::failed_device_ids() {
    auto now = clock_.now();
    std::lock_guard lock(mutex_);
    cleanup_locked(now);

    std::unordered_set<ControlId> ids;
    for (const auto& [id, entry] : entries_) {
        if (is_failed(entry) && now < entry.last_failed_time + kTimeToStayFailed) {
            ids.insert(id);
        }
    }
    return ids;
}

uint32_t FailedDeviceTable::failure_count(const ControlId& control_id) const {
    auto now = clock_.now();
    std::lock_guard lock(mutex_);
    auto it = entries_.find(control_id);
    if (it == entries_.end() || is_expired(it->second, now)) return 0;
    return it->second.failure_count;
}

size_t FailedDeviceTable::entry_count() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool FailedDeviceTable::cleanup_task_running() const {
    std::lock_guard lock(mutex_);
    return cleanup_task_ && cleanup_task_->is_running();
}

bool FailedDeviceTable::is_failed(const FailedDeviceEntryInfo& entry) const noexcept {
    return entry.failure_count >= threshold_;
}

bool FailedDeviceTable::is_expired(const FailedDeviceEntryInfo& entry, Timestamp now) const noexcept {
    if (is_failed(entry)) {
        return now > entry.last_failed_time + kTimeToStayFailed;
    }
    return now > entry.last_failed_time + kEntryExpirationTime;
}

size_t FailedDeviceTable::cleanup_locked(Timestamp now) {
    return std::erase_if(entries_, [&](const auto& item) {
        return is_expired(item.second, now);
    });
}

void FailedDeviceTable::run_cleanup() {
    auto now = clock_.now();
    size_t removed = 0;
    size_t remaining = 0;
    {
        std::lock_guard lock(mutex_);
        removed = cleanup_locked(now);
        remaining = entries_.size();
    }
    if (removed > 0) {
        logger_.debug(std::format("Purged {} expired failed-device entries, {} left", removed, remaining));
    }
}

}  // namespace lab_alloc
