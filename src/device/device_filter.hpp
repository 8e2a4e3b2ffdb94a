/**
 * @file device_filter.hpp
 * @brief Pre-filter selecting the diagnostic candidates of a job.
 */

#pragma once

#include "device/device_query.hpp"
#include "model/schedule_unit.hpp"

#include <vector>

namespace lab_alloc {

/**
 * @brief Builds the inventory query for a job's candidate devices.
 *
 * Only the device type is constrained, so devices that miss other
 * requirements still show up as near-misses in the report. Callers can add
 * dimension filters of their own (e.g. restricting to one lab).
 */
class DeviceFilter {
public:
    DeviceFilter() = default;
    explicit DeviceFilter(std::vector<DimensionFilter> extra_dimension_filters)
        : extra_dimension_filters_(std::move(extra_dimension_filters)) {}

    [[nodiscard]] DeviceQueryFilter filter_for(const JobScheduleUnit& job) const;

private:
    std::vector<DimensionFilter> extra_dimension_filters_;
};

}  // namespace lab_alloc
