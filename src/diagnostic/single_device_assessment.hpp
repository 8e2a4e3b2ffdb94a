/**
 * @file single_device_assessment.hpp
 * @brief Scores how well one device, or a group of devices, supports a job.
 */

#pragma once

#include "model/device_info.hpp"
#include "model/schedule_unit.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lab_alloc {

/**
 * @brief Accumulating assessment of devices against a job's requirements.
 *
 * Each added device can only widen what is supported: the assessment of a
 * group answers "can *some* device satisfy each requirement". A score of
 * kMaxScore means every requirement is supported; higher is better.
 *
 * Weight rules: a requirement whose support should promote a device gets a
 * high weight; a requirement that should barely matter when supported gets
 * a low one.
 */
class SingleDeviceAssessment {
public:
    static constexpr int kWeightAccess = 3;
    static constexpr int kWeightDeviceType = 2;
    static constexpr int kWeightDriver = 2;
    static constexpr int kWeightDecorator = 5;
    static constexpr int kWeightSupportedDimension = 5;
    static constexpr int kWeightSatisfiedDimension = 4;
    static constexpr int kWeightStatus = 1;

    static constexpr int kMaxScore = kWeightAccess + kWeightDeviceType + kWeightDriver
                                   + kWeightDecorator + kWeightSupportedDimension
                                   + kWeightSatisfiedDimension + kWeightStatus;
    static constexpr int kMinScore = 0;

    /// Devices owned only by the default owner could be claimed by the user.
    static constexpr int kSupplementPotentialAccess = kWeightAccess - 1;

    /// One missing dimension costs more than being busy or default-owned.
    static constexpr int kDeductionSingleDimension = 2;
    static constexpr int kDeductionLabelDimension = 3;
    /// id / host_ip / host_name pin the job to specific hardware.
    static constexpr int kDeductionStrongDimension = 4;

    /// Assessment against the job's primary requirement.
    explicit SingleDeviceAssessment(const JobScheduleUnit& job);

    /// Assessment against one of the job's device requirements.
    SingleDeviceAssessment(const JobScheduleUnit& job, const DeviceRequirement& requirement);

    SingleDeviceAssessment& add_resource(const DeviceInfo& device);

    [[nodiscard]] bool is_accessible() const noexcept { return accessible_; }
    [[nodiscard]] bool is_potential_accessible() const noexcept { return potential_accessible_; }
    [[nodiscard]] bool is_driver_supported() const noexcept { return driver_supported_; }
    [[nodiscard]] bool is_device_type_supported() const noexcept { return device_type_supported_; }

    [[nodiscard]] bool is_decorators_supported() const noexcept { return unsupported_decorators_.empty(); }
    [[nodiscard]] const std::set<std::string>& unsupported_decorators() const noexcept {
        return unsupported_decorators_;
    }

    /// Job dimensions supported, shared dimensions included.
    [[nodiscard]] bool is_dimensions_supported() const;
    /// Unsupported job dimensions; unsupported shared dimension names map to "".
    [[nodiscard]] JobDimensions unsupported_dimensions() const;
    [[nodiscard]] const std::map<std::string, std::vector<std::string>>& supported_shared_dimensions() const noexcept {
        return supported_shared_dimensions_;
    }

    /// Every required device dimension is requested by the job.
    [[nodiscard]] bool is_dimensions_satisfied() const noexcept;
    [[nodiscard]] std::map<std::string, std::set<std::string>> unsatisfied_dimensions() const;

    [[nodiscard]] bool is_idle() const noexcept { return idle_; }
    /// True when no device was added or all added devices are missing.
    [[nodiscard]] bool is_missing() const noexcept { return missing_; }

    /// Everything matches except that no device is idle.
    [[nodiscard]] bool is_requirement_matched_but_busy() const;

    [[nodiscard]] int score() const;
    [[nodiscard]] bool has_max_score() const { return score() == kMaxScore; }

private:
    SingleDeviceAssessment(const JobScheduleUnit& job,
                           std::string device_type,
                           const std::vector<std::string>& decorators,
                           JobDimensions dimensions);

    [[nodiscard]] int accessible_score() const noexcept;
    [[nodiscard]] int supported_dimension_score() const;
    [[nodiscard]] int satisfied_dimension_score() const noexcept;

    std::string user_;
    std::string driver_;
    std::string device_type_;
    JobDimensions requested_dimensions_;
    std::vector<std::string> requested_shared_dimension_names_;

    bool accessible_ = false;
    bool potential_accessible_ = false;
    bool driver_supported_ = false;
    bool device_type_supported_ = false;
    bool idle_ = false;
    bool missing_ = true;

    std::set<std::string> unsupported_decorators_;
    JobDimensions unsupported_dimensions_;
    /// Unset until the first device is added.
    std::optional<std::map<std::string, std::set<std::string>>> unsatisfied_dimensions_;
    std::map<std::string, std::vector<std::string>> supported_shared_dimensions_;
};

}  // namespace lab_alloc
