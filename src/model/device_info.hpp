/**
 * @file device_info.hpp
 * @brief In-process model of a lab device as seen by the diagnostician.
 */

#pragma once

#include "core/types.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace lab_alloc {

struct LabLocator {
    std::string ip;
    std::string host_name;

    bool operator==(const LabLocator&) const = default;
};

struct DeviceLocator {
    std::string serial;
    LabLocator lab;

    /// serial@lab_ip, unique across labs.
    [[nodiscard]] std::string universal_id() const { return serial + "@" + lab.ip; }

    bool operator==(const DeviceLocator&) const = default;
};

/// Job dimensions: name -> requested value (or "regex:<pattern>").
using JobDimensions = std::map<std::string, std::string>;

/**
 * @brief Ordered multimap of dimension name to values.
 */
class DimensionSet {
public:
    void add(const std::string& name, const std::string& value);

    /// All values of a name, in insertion order. Empty if absent.
    [[nodiscard]] std::vector<std::string> get(const std::string& name) const;
    [[nodiscard]] bool has(const std::string& name) const;
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
    [[nodiscard]] size_t size() const noexcept;

    [[nodiscard]] const std::map<std::string, std::vector<std::string>>& all() const noexcept {
        return values_;
    }

private:
    std::map<std::string, std::vector<std::string>> values_;
};

/**
 * @brief Device dimensions split into "required" (the job must ask for them)
 *        and "supported" (the device offers them).
 */
struct DeviceDimensions {
    DimensionSet required;
    DimensionSet supported;

    /**
     * @brief Job dimensions that no supported or required value of this
     *        device matches. Returns the subset of @p job_dimensions.
     */
    [[nodiscard]] JobDimensions unsupported_job_dimensions(const JobDimensions& job_dimensions) const;

    /**
     * @brief Required device dimensions (name -> values) that the job does
     *        not request with a matching value.
     */
    [[nodiscard]] std::map<std::string, std::set<std::string>> unsatisfied_device_dimensions(
        const JobDimensions& job_dimensions) const;
};

/**
 * @brief Whether a job dimension value (plain or "regex:" prefixed) matches a
 *        device dimension value. Plain values compare case-insensitively.
 */
[[nodiscard]] bool dimension_value_matches(const std::string& job_value,
                                           const std::string& device_value);

struct DeviceInfo {
    DeviceLocator locator;
    DeviceStatus status{DeviceStatus::Idle};
    std::set<std::string> owners;
    std::set<std::string> types;
    std::set<std::string> drivers;
    std::set<std::string> decorators;
    DeviceDimensions dimensions;

    /// Devices without owners are shared with everybody.
    [[nodiscard]] bool owners_support(const std::string& user) const {
        return owners.empty() || owners.contains(user);
    }
    [[nodiscard]] bool supports_type(const std::string& type) const { return types.contains(type); }
    [[nodiscard]] bool supports_driver(const std::string& driver) const {
        return drivers.contains(driver);
    }

    /// Subset of @p requested decorators this device does not support.
    [[nodiscard]] std::set<std::string> unsupported_decorators(
        const std::set<std::string>& requested) const;
};

}  // namespace lab_alloc
