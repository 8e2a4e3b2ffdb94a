/**
 * @file single_device_diagnostician.hpp
 * @brief Explains why a single-device job cannot allocate a device.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "device/device_filter.hpp"
#include "device/device_query.hpp"
#include "diagnostic/single_device_assessor.hpp"
#include "diagnostic/single_device_report.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace lab_alloc {

/**
 * @brief Diagnoses a job that fails to allocate a device.
 *
 * diagnose_job() may be called repeatedly while the job waits. The first pass
 * queries every candidate of the job; later passes re-query only the devices
 * that were perfect matches, as long as there are few of them. Each pass
 * works on a copy of the previous report, so published reports are never
 * mutated and the history holds one snapshot per pass.
 *
 * Passes are serialized; last_report() may be read from any thread.
 */
class SingleDeviceDiagnostician {
public:
    SingleDeviceDiagnostician(std::shared_ptr<const JobScheduleUnit> job,
                              IDeviceQuerier& querier,
                              Logger& logger,
                              DiagnosticConfig config = {},
                              DeviceFilter filter = {},
                              std::shared_ptr<const SingleDeviceAssessor> assessor = nullptr);

    /**
     * @brief Runs one diagnostic pass.
     *
     * On a query or conversion error the error is returned and the last
     * report and history are left as they were.
     */
    [[nodiscard]] Result<std::shared_ptr<const SingleDeviceReport>> diagnose_job(bool no_perfect_candidate);

    /// The most recent report, nullptr before the first successful pass.
    [[nodiscard]] std::shared_ptr<const SingleDeviceReport> last_report() const;

    [[nodiscard]] size_t history_size() const;

    /// Some candidate of the last pass matched everything but was not idle.
    [[nodiscard]] bool has_device_matched_requirement_but_busy() const noexcept {
        return matched_but_busy_.load(std::memory_order_acquire);
    }

    /// The filter the next pass would query with.
    [[nodiscard]] DeviceQueryFilter current_query_filter() const;

    /// Logs the perfect candidates of each pass and their score history.
    void log_extra_info() const;

    [[nodiscard]] const JobScheduleUnit& job() const noexcept { return *job_; }

    /// Converts an inventory record into the diagnostic device model.
    [[nodiscard]] static Result<DeviceInfo> convert_device_info(const QueryDeviceInfo& record);

private:
    [[nodiscard]] Result<std::vector<DeviceInfo>> query_devices(const DeviceQueryFilter& filter);
    [[nodiscard]] bool is_candidate(const DeviceInfo& device) const;

    std::shared_ptr<const JobScheduleUnit> job_;
    IDeviceQuerier& querier_;
    Logger& logger_;
    DiagnosticConfig config_;
    DeviceFilter filter_;
    std::shared_ptr<const SingleDeviceAssessor> assessor_;

    std::mutex diagnose_mutex_;
    std::atomic<std::shared_ptr<const SingleDeviceReport>> last_report_;
    std::atomic<bool> matched_but_busy_{false};

    mutable std::mutex history_mutex_;
    std::vector<std::shared_ptr<const SingleDeviceReport>> history_;
};

}  // namespace lab_alloc
