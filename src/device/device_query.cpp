/**
 * @file device_query.cpp
 * @brief DeviceQueryFilter matching and the in-memory querier.
 */

#include "device/device_query.hpp"

#include <algorithm>
#include <iterator>
#include <regex>

namespace lab_alloc {

namespace {

bool full_match(const std::string& pattern, const std::string& value) {
    try {
        return std::regex_match(value, std::regex(pattern));
    } catch (const std::regex_error&) {
        return false;
    }
}

bool any_matches(const std::string& pattern, const std::vector<std::string>& values) {
    return std::any_of(values.begin(), values.end(),
                       [&](const std::string& v) { return full_match(pattern, v); });
}

bool all_patterns_match(const std::vector<std::string>& patterns,
                        const std::vector<std::string>& values) {
    return std::all_of(patterns.begin(), patterns.end(),
                       [&](const std::string& p) { return any_matches(p, values); });
}

bool dimension_filter_matches(const DimensionFilter& filter, const QueryDeviceInfo& device) {
    if (filter.name == "id") {
        return full_match(filter.value_regex, device.id);
    }
    return std::any_of(device.dimensions.begin(), device.dimensions.end(),
                       [&](const QueryDimension& d) {
                           return d.name == filter.name && full_match(filter.value_regex, d.value);
                       });
}

}  // anonymous namespace

bool DeviceQueryFilter::matches(const QueryDeviceInfo& device) const {
    for (const auto& filter : dimension_filters) {
        if (!dimension_filter_matches(filter, device)) return false;
    }
    if (!status_regex.empty() && !full_match(status_regex, device.status)) return false;
    return all_patterns_match(type_regex, device.types)
        && all_patterns_match(driver_regex, device.drivers)
        && all_patterns_match(decorator_regex, device.decorators)
        && all_patterns_match(owner_regex, device.owners);
}

// ── InMemoryDeviceQuerier ────────────────────

InMemoryDeviceQuerier::InMemoryDeviceQuerier(std::vector<QueryDeviceInfo> devices)
    : devices_(std::move(devices)) {}

Result<DeviceQueryResult> InMemoryDeviceQuerier::query_device(const DeviceQueryFilter& filter) {
    std::lock_guard lock(mutex_);
    ++query_count_;
    last_filter_ = filter;
    if (next_error_) {
        Error error = std::move(*next_error_);
        next_error_.reset();
        return error;
    }

    DeviceQueryResult result;
    std::copy_if(devices_.begin(), devices_.end(), std::back_inserter(result.devices),
                 [&](const QueryDeviceInfo& device) { return filter.matches(device); });
    return result;
}

void InMemoryDeviceQuerier::set_devices(std::vector<QueryDeviceInfo> devices) {
    std::lock_guard lock(mutex_);
    devices_ = std::move(devices);
}

void InMemoryDeviceQuerier::upsert_device(QueryDeviceInfo device) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&](const QueryDeviceInfo& d) { return d.id == device.id; });
    if (it != devices_.end()) {
        *it = std::move(device);
    } else {
        devices_.push_back(std::move(device));
    }
}

bool InMemoryDeviceQuerier::remove_device(const std::string& id) {
    std::lock_guard lock(mutex_);
    return std::erase_if(devices_, [&](const QueryDeviceInfo& d) { return d.id == id; }) > 0;
}

void InMemoryDeviceQuerier::fail_next_query(Error error) {
    std::lock_guard lock(mutex_);
    next_error_ = std::move(error);
}

size_t InMemoryDeviceQuerier::query_count() const {
    std::lock_guard lock(mutex_);
    return query_count_;
}

std::optional<DeviceQueryFilter> InMemoryDeviceQuerier::last_filter() const {
    std::lock_guard lock(mutex_);
    return last_filter_;
}

}  // namespace lab_alloc
