/**
 * @file single_device_assessor.cpp
 * @brief SingleDeviceAssessor implementation.
 */

#include "diagnostic/single_device_assessor.hpp"

namespace lab_alloc {

SingleDeviceAssessment SingleDeviceAssessor::assess(const JobScheduleUnit& job,
                                                    const DeviceInfo& device) const {
    SingleDeviceAssessment assessment(job);
    assessment.add_resource(device);
    return assessment;
}

SingleDeviceAssessment SingleDeviceAssessor::assess(const JobScheduleUnit& job,
                                                    const std::vector<DeviceInfo>& devices) const {
    SingleDeviceAssessment assessment(job);
    for (const auto& device : devices) {
        assessment.add_resource(device);
    }
    return assessment;
}

SingleDeviceAssessment SingleDeviceAssessor::assess(const JobScheduleUnit& job,
                                                    const DeviceRequirement& requirement,
                                                    const DeviceInfo& device) const {
    SingleDeviceAssessment assessment(job, requirement);
    assessment.add_resource(device);
    return assessment;
}

SingleDeviceAssessment SingleDeviceAssessor::assess(const JobScheduleUnit& job,
                                                    const DeviceRequirement& requirement,
                                                    const std::vector<DeviceInfo>& devices) const {
    SingleDeviceAssessment assessment(job, requirement);
    for (const auto& device : devices) {
        assessment.add_resource(device);
    }
    return assessment;
}

}  // namespace lab_alloc
