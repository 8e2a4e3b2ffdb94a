/**
 * @file single_device_assessor.hpp
 * @brief Produces SingleDeviceAssessments for a job.
 */

#pragma once

#include "diagnostic/single_device_assessment.hpp"

#include <vector>

namespace lab_alloc {

/**
 * @brief Assesses devices against a job. Virtual so tests and alternative
 *        scoring strategies can be injected into the diagnostician.
 */
class SingleDeviceAssessor {
public:
    virtual ~SingleDeviceAssessor() = default;

    [[nodiscard]] virtual SingleDeviceAssessment assess(const JobScheduleUnit& job,
                                                        const DeviceInfo& device) const;

    /// Group assessment: what *some* device of @p devices supports.
    [[nodiscard]] virtual SingleDeviceAssessment assess(const JobScheduleUnit& job,
                                                        const std::vector<DeviceInfo>& devices) const;

    [[nodiscard]] virtual SingleDeviceAssessment assess(const JobScheduleUnit& job,
                                                        const DeviceRequirement& requirement,
                                                        const DeviceInfo& device) const;

    [[nodiscard]] virtual SingleDeviceAssessment assess(const JobScheduleUnit& job,
                                                        const DeviceRequirement& requirement,
                                                        const std::vector<DeviceInfo>& devices) const;
};

}  // namespace lab_alloc
