/**
 * @file single_device_report.hpp
 * @brief Allocation diagnostic report for a job that cannot get a device.
 */

#pragma once

#include "core/config.hpp"
#include "diagnostic/single_device_assessment.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lab_alloc {

enum class AllocationErrorId : uint8_t {
    UserConfigError,
    UserConfigErrorDeviceNoAccess,
    UserConfigErrorDeviceNotExist,
    UserConfigErrorDeviceMissing,
    UserConfigErrorDeviceBusy,
    DeviceNotSatisfySlo,
    InfraError
};

[[nodiscard]] constexpr std::string_view to_string(AllocationErrorId id) noexcept {
    switch (id) {
        case AllocationErrorId::UserConfigError:               return "USER_CONFIG_ERROR";
        case AllocationErrorId::UserConfigErrorDeviceNoAccess: return "USER_CONFIG_ERROR_DEVICE_NO_ACCESS";
        case AllocationErrorId::UserConfigErrorDeviceNotExist: return "USER_CONFIG_ERROR_DEVICE_NOT_EXIST";
        case AllocationErrorId::UserConfigErrorDeviceMissing:  return "USER_CONFIG_ERROR_DEVICE_MISSING";
        case AllocationErrorId::UserConfigErrorDeviceBusy:     return "USER_CONFIG_ERROR_DEVICE_BUSY";
        case AllocationErrorId::DeviceNotSatisfySlo:           return "DEVICE_NOT_SATISFY_SLO";
        case AllocationErrorId::InfraError:                    return "INFRA_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief The single most likely reason, when one can be named.
 */
struct AllocationCause {
    AllocationErrorId error_id;
    std::string message;
};

/**
 * @brief Human-readable explanation plus a classification of the failure.
 */
struct DiagnosticResult {
    AllocationErrorId error_id;
    std::string message;
    std::optional<AllocationCause> cause;
};

/**
 * @brief Whether @p latest should replace @p previous in a report.
 *
 * True if nothing is stored yet, or the stored assessment is a perfect match
 * and the new one is not. A device recorded as imperfect is never upgraded
 * back, so the report keeps the worst state seen while the job waits.
 */
[[nodiscard]] bool should_replace_assessment(const SingleDeviceAssessment* previous,
                                             const SingleDeviceAssessment& latest);

/// The assessment to store given what is stored now (nullptr if nothing).
[[nodiscard]] SingleDeviceAssessment merge_assessment(const SingleDeviceAssessment* previous,
                                                      SingleDeviceAssessment latest);

/**
 * @brief Report built by SingleDeviceDiagnostician.
 *
 * Only meaningful while the job actually fails to allocate; otherwise the
 * messages are misleading. Not thread-safe: the diagnostician copies a
 * published report before changing it.
 */
class SingleDeviceReport {
public:
    /**
     * @param overall_assessment Assessment of all candidates together; absent
     *        when no candidate passed the filters.
     */
    SingleDeviceReport(std::shared_ptr<const JobScheduleUnit> job,
                       std::optional<SingleDeviceAssessment> overall_assessment,
                       bool no_perfect_candidate,
                       DiagnosticConfig config = {});

    [[nodiscard]] const JobScheduleUnit& job() const noexcept { return *job_; }

    /// kMinScore without an overall assessment.
    [[nodiscard]] int overall_score() const;
    [[nodiscard]] const std::optional<SingleDeviceAssessment>& overall_assessment() const noexcept {
        return overall_assessment_;
    }

    /// Stores @p assessment for @p device_id. A device whose score is unchanged
    /// keeps its place among the devices with that score.
    void set_device_assessment(const std::string& device_id, SingleDeviceAssessment assessment);
    [[nodiscard]] const SingleDeviceAssessment* device_assessment(const std::string& device_id) const;
    [[nodiscard]] size_t device_count() const noexcept { return device_assessments_.size(); }

    [[nodiscard]] bool has_perfect_match() const;
    /// Perfect devices in the order they were recorded.
    [[nodiscard]] std::vector<std::string> perfect_match_devices() const;

    [[nodiscard]] bool no_perfect_candidate() const noexcept { return no_perfect_candidate_; }

    [[nodiscard]] DiagnosticResult result() const;

private:
    [[nodiscard]] DiagnosticResult overall_failure_result() const;
    [[nodiscard]] DiagnosticResult perfect_match_result(const std::vector<std::string>& ids) const;
    [[nodiscard]] DiagnosticResult candidate_suggestion_result() const;

    std::shared_ptr<const JobScheduleUnit> job_;
    std::optional<SingleDeviceAssessment> overall_assessment_;
    std::unordered_map<std::string, SingleDeviceAssessment> device_assessments_;
    std::map<int, std::vector<std::string>> score_to_device_ids_;
    bool no_perfect_candidate_;
    DiagnosticConfig config_;
};

}  // namespace lab_alloc
