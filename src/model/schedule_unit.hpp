/**
 * @file schedule_unit.hpp
 * @brief Immutable scheduling projections of jobs and tests.
 *
 * A schedule unit carries only what the scheduler and the allocation
 * diagnostician need: identity, user, driver, device requirements, priority,
 * timeout and timing. It is created once per job/test and never mutated.
 */

#pragma once

#include "core/clock.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "model/device_info.hpp"
#include "model/timing.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lab_alloc {

// ─────────────────────────────────────────────
// Locators
// ─────────────────────────────────────────────

struct JobLocator {
    JobId id;
    std::string name;

    [[nodiscard]] std::string to_string() const { return name + "(" + id + ")"; }
    bool operator==(const JobLocator&) const = default;
};

struct TestLocator {
    TestId id;
    std::string name;
    JobLocator job;

    [[nodiscard]] std::string to_string() const { return name + "(" + id + ")@" + job.to_string(); }
    bool operator==(const TestLocator&) const = default;
};

struct JobUser {
    std::string run_as;
    std::string actual_user;

    bool operator==(const JobUser&) const = default;
};

// ─────────────────────────────────────────────
// Device Requirements
// ─────────────────────────────────────────────

struct DeviceRequirement {
    std::string device_type;
    std::vector<std::string> decorators;
    JobDimensions dimensions;

    bool operator==(const DeviceRequirement&) const = default;
};

struct DeviceRequirements {
    std::vector<DeviceRequirement> devices;
    /// Dimensions whose value must be shared by all allocated devices.
    std::vector<std::string> shared_dimension_names;

    [[nodiscard]] bool empty() const noexcept { return devices.empty(); }
    bool operator==(const DeviceRequirements&) const = default;
};

// ─────────────────────────────────────────────
// Feature / Setting records
// ─────────────────────────────────────────────

/**
 * @brief Scheduling-relevant slice of a submitted job's feature record.
 */
struct JobFeature {
    JobUser user;
    std::string driver;
    DeviceRequirements device_requirements;
    Priority priority{Priority::Default};
    DeviceAllocationPriority allocation_priority{DeviceAllocationPriority::Default};

    bool operator==(const JobFeature&) const = default;
};

struct JobSetting {
    std::optional<Timeout> timeout;
    std::string allocation_exit_strategy;
};

// ─────────────────────────────────────────────
// JobScheduleUnit
// ─────────────────────────────────────────────

class JobScheduleUnit {
public:
    /**
     * @brief Inputs to create(). Either device_type or device_requirements
     *        must be given; the rest has defaults.
     */
    struct Params {
        JobLocator locator;
        JobUser user;
        std::string driver;
        std::optional<std::string> device_type;
        std::vector<std::string> decorators;       ///< Used with device_type
        JobDimensions dimensions;                  ///< Used with device_type
        std::optional<DeviceRequirements> device_requirements;
        Priority priority{Priority::Default};
        Timeout timeout;
        std::optional<Timing> timing;
        DeviceAllocationPriority allocation_priority{DeviceAllocationPriority::Default};
        std::string allocation_exit_strategy;
    };

    /**
     * @brief Validates @p params and derives timing and timer.
     *
     * Fails with ErrorCode::IllegalState when neither device_type nor a
     * non-empty device_requirements is given.
     */
    [[nodiscard]] static Result<JobScheduleUnit> create(Params params, const IClock& clock);

    /**
     * @brief Builds a unit from the job's feature and (optional) setting
     *        records. Without a setting the timeout is zero.
     */
    [[nodiscard]] static Result<JobScheduleUnit> from_features(const JobLocator& locator,
                                                               const JobFeature& feature,
                                                               const std::optional<JobSetting>& setting,
                                                               const IClock& clock);

    [[nodiscard]] const JobLocator& locator() const noexcept { return locator_; }
    [[nodiscard]] const JobUser& user() const noexcept { return user_; }
    [[nodiscard]] const std::string& driver() const noexcept { return driver_; }
    [[nodiscard]] const DeviceRequirements& device_requirements() const noexcept {
        return device_requirements_;
    }

    /// Shortcuts to the first device requirement.
    [[nodiscard]] const std::string& device_type() const noexcept;
    [[nodiscard]] const std::vector<std::string>& decorators() const noexcept;
    [[nodiscard]] const JobDimensions& dimensions() const noexcept;

    [[nodiscard]] Priority priority() const noexcept { return priority_; }
    [[nodiscard]] const Timeout& timeout() const noexcept { return timeout_; }
    [[nodiscard]] const Timing& timing() const noexcept { return timing_; }
    [[nodiscard]] const CountDownTimer& timer() const noexcept { return timer_; }
    [[nodiscard]] DeviceAllocationPriority allocation_priority() const noexcept {
        return allocation_priority_;
    }
    [[nodiscard]] const std::string& allocation_exit_strategy() const noexcept {
        return allocation_exit_strategy_;
    }

    /// Lossy inverse of from_features(). Computed once at creation.
    [[nodiscard]] const JobFeature& to_feature() const noexcept { return feature_; }

private:
    JobScheduleUnit(Params params, DeviceRequirements requirements, Timing timing);

    JobLocator locator_;
    JobUser user_;
    std::string driver_;
    DeviceRequirements device_requirements_;
    Priority priority_;
    Timeout timeout_;
    Timing timing_;
    CountDownTimer timer_;
    DeviceAllocationPriority allocation_priority_;
    std::string allocation_exit_strategy_;
    JobFeature feature_;
};

// ─────────────────────────────────────────────
// TestScheduleUnit
// ─────────────────────────────────────────────

class TestScheduleUnit {
public:
    TestScheduleUnit(TestLocator locator, Timing timing, Priority priority = Priority::Default)
        : locator_(std::move(locator)), priority_(priority), timing_(timing) {}

    [[nodiscard]] const TestLocator& locator() const noexcept { return locator_; }
    [[nodiscard]] Priority priority() const noexcept { return priority_; }
    [[nodiscard]] const Timing& timing() const noexcept { return timing_; }

private:
    TestLocator locator_;
    Priority priority_;
    Timing timing_;
};

}  // namespace lab_alloc
