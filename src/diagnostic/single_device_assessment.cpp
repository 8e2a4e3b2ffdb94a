/**
 * @file single_device_assessment.cpp
 * @brief SingleDeviceAssessment scoring.
 */

#include "diagnostic/single_device_assessment.hpp"

#include "model/dimension.hpp"

#include <algorithm>

namespace lab_alloc {

SingleDeviceAssessment::SingleDeviceAssessment(const JobScheduleUnit& job)
    : SingleDeviceAssessment(job, job.device_type(), job.decorators(), job.dimensions()) {}

SingleDeviceAssessment::SingleDeviceAssessment(const JobScheduleUnit& job,
                                               const DeviceRequirement& requirement)
    : SingleDeviceAssessment(job, requirement.device_type, requirement.decorators,
                             requirement.dimensions) {}

SingleDeviceAssessment::SingleDeviceAssessment(const JobScheduleUnit& job,
                                               std::string device_type,
                                               const std::vector<std::string>& decorators,
                                               JobDimensions dimensions)
    : user_(job.user().run_as)
    , driver_(job.driver())
    , device_type_(std::move(device_type))
    , requested_dimensions_(dimensions)
    , requested_shared_dimension_names_(job.device_requirements().shared_dimension_names)
    , unsupported_decorators_(decorators.begin(), decorators.end())
    , unsupported_dimensions_(std::move(dimensions)) {}

SingleDeviceAssessment& SingleDeviceAssessment::add_resource(const DeviceInfo& device) {
    // A device can only be potentially accessible when none is accessible.
    if (device.owners_support(user_)) {
        accessible_ = true;
        potential_accessible_ = false;
    } else if (!accessible_) {
        if (device.owners.size() == 1
            && device.owners.contains(std::string{dimension::kDeviceDefaultOwner})) {
            potential_accessible_ = true;
        }
    }
    driver_supported_ |= device.supports_driver(driver_);
    device_type_supported_ |= device.supports_type(device_type_);

    if (!unsupported_decorators_.empty()) {
        unsupported_decorators_ = device.unsupported_decorators(unsupported_decorators_);
    }
    if (!unsupported_dimensions_.empty()) {
        unsupported_dimensions_ = device.dimensions.unsupported_job_dimensions(unsupported_dimensions_);
    }
    for (const auto& name : requested_shared_dimension_names_) {
        for (const auto* set : {&device.dimensions.supported, &device.dimensions.required}) {
            for (const auto& value : set->get(name)) {
                supported_shared_dimensions_[name].push_back(value);
            }
        }
    }
    idle_ |= (device.status == DeviceStatus::Idle);
    missing_ &= (device.status == DeviceStatus::Missing);

    auto device_unsatisfied = device.dimensions.unsatisfied_device_dimensions(requested_dimensions_);
    if (!unsatisfied_dimensions_) {
        unsatisfied_dimensions_ = std::move(device_unsatisfied);
    } else if (!unsatisfied_dimensions_->empty()) {
        // Only what no device satisfies so far stays unsatisfied.
        std::map<std::string, std::set<std::string>> intersection;
        for (const auto& [name, values] : *unsatisfied_dimensions_) {
            auto it = device_unsatisfied.find(name);
            if (it == device_unsatisfied.end()) continue;
            for (const auto& value : values) {
                if (it->second.contains(value)) intersection[name].insert(value);
            }
        }
        unsatisfied_dimensions_ = std::move(intersection);
    }
    return *this;
}

bool SingleDeviceAssessment::is_dimensions_supported() const {
    return unsupported_dimensions_.empty()
        && supported_shared_dimensions_.size() == requested_shared_dimension_names_.size();
}

JobDimensions SingleDeviceAssessment::unsupported_dimensions() const {
    JobDimensions result = unsupported_dimensions_;
    for (const auto& name : requested_shared_dimension_names_) {
        if (!supported_shared_dimensions_.contains(name)) {
            result.try_emplace(name, "");
        }
    }
    return result;
}

bool SingleDeviceAssessment::is_dimensions_satisfied() const noexcept {
    return !unsatisfied_dimensions_ || unsatisfied_dimensions_->empty();
}

std::map<std::string, std::set<std::string>> SingleDeviceAssessment::unsatisfied_dimensions() const {
    return unsatisfied_dimensions_.value_or(std::map<std::string, std::set<std::string>>{});
}

bool SingleDeviceAssessment::is_requirement_matched_but_busy() const {
    return score() == kMaxScore - (kWeightStatus - kMinScore) && !is_idle();
}

int SingleDeviceAssessment::score() const {
    return accessible_score()
        + (driver_supported_ ? kWeightDriver : kMinScore)
        + (device_type_supported_ ? kWeightDeviceType : kMinScore)
        + std::max(kMinScore, kWeightDecorator - static_cast<int>(unsupported_decorators_.size()))
        + supported_dimension_score()
        + satisfied_dimension_score()
        + (idle_ ? kWeightStatus : kMinScore);
}

int SingleDeviceAssessment::accessible_score() const noexcept {
    if (accessible_) return kWeightAccess;
    if (potential_accessible_) return kMinScore + kSupplementPotentialAccess;
    return kMinScore;
}

int SingleDeviceAssessment::supported_dimension_score() const {
    auto unsupported = unsupported_dimensions();
    int score = kWeightSupportedDimension
              - static_cast<int>(unsupported.size()) * kDeductionSingleDimension;
    if (unsupported.contains(std::string{dimension::name::kLabel})) {
        score = score - kDeductionLabelDimension + kDeductionSingleDimension;
    }
    if (unsupported.contains(std::string{dimension::name::kId})
        || unsupported.contains(std::string{dimension::name::kHostIp})
        || unsupported.contains(std::string{dimension::name::kHostName})) {
        score = score - kDeductionStrongDimension + kDeductionSingleDimension;
    }
    return std::max(kMinScore, score);
}

int SingleDeviceAssessment::satisfied_dimension_score() const noexcept {
    size_t unsatisfied = 0;
    if (unsatisfied_dimensions_) {
        for (const auto& [name, values] : *unsatisfied_dimensions_) unsatisfied += values.size();
    }
    return std::max(kMinScore, kWeightSatisfiedDimension - static_cast<int>(unsatisfied));
}

}  // namespace lab_alloc
