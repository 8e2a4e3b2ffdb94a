/**
 * @file schedule_unit.cpp
 * @brief JobScheduleUnit validation and derivation.
 */

#include "model/schedule_unit.hpp"

namespace lab_alloc {

Result<JobScheduleUnit> JobScheduleUnit::create(Params params, const IClock& clock) {
    DeviceRequirements requirements;
    if (params.device_requirements && !params.device_requirements->empty()) {
        requirements = std::move(*params.device_requirements);
    } else if (params.device_type) {
        requirements.devices.push_back(DeviceRequirement{
            .device_type = *params.device_type,
            .decorators = params.decorators,
            .dimensions = params.dimensions});
    } else {
        // Point callers at the simpler of the two fields.
        return Error{ErrorCode::IllegalState,
                     "Missing required field device_type for job " + params.locator.to_string()};
    }

    Timing timing = params.timing ? *params.timing : Timing::fresh(clock);
    return JobScheduleUnit(std::move(params), std::move(requirements), timing);
}

Result<JobScheduleUnit> JobScheduleUnit::from_features(const JobLocator& locator,
                                                       const JobFeature& feature,
                                                       const std::optional<JobSetting>& setting,
                                                       const IClock& clock) {
    Params params;
    params.locator = locator;
    params.user = feature.user;
    params.driver = feature.driver;
    params.device_requirements = feature.device_requirements;
    params.priority = feature.priority;
    params.allocation_priority = feature.allocation_priority;
    if (setting) {
        params.timeout = setting->timeout.value_or(Timeout{});
        params.allocation_exit_strategy = setting->allocation_exit_strategy;
    }
    return create(std::move(params), clock);
}

JobScheduleUnit::JobScheduleUnit(Params params, DeviceRequirements requirements, Timing timing)
    : locator_(std::move(params.locator))
    , user_(std::move(params.user))
    , driver_(std::move(params.driver))
    , device_requirements_(std::move(requirements))
    , priority_(params.priority)
    , timeout_(params.timeout)
    , timing_(timing)
    , timer_(timing_, timeout_)
    , allocation_priority_(params.allocation_priority)
    , allocation_exit_strategy_(std::move(params.allocation_exit_strategy))
    , feature_(JobFeature{
          .user = user_,
          .driver = driver_,
          .device_requirements = device_requirements_,
          .priority = priority_,
          .allocation_priority = allocation_priority_}) {}

const std::string& JobScheduleUnit::device_type() const noexcept {
    return device_requirements_.devices.front().device_type;
}

const std::vector<std::string>& JobScheduleUnit::decorators() const noexcept {
    return device_requirements_.devices.front().decorators;
}

const JobDimensions& JobScheduleUnit::dimensions() const noexcept {
    return device_requirements_.devices.front().dimensions;
}

}  // namespace lab_alloc
