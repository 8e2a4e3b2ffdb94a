/**
 * @file device_info.cpp
 * @brief Dimension matching for DeviceInfo.
 */

#include "model/device_info.hpp"

#include "model/dimension.hpp"

#include <algorithm>
#include <iterator>
#include <regex>

namespace lab_alloc {

void DimensionSet::add(const std::string& name, const std::string& value) {
    values_[name].push_back(value);
}

std::vector<std::string> DimensionSet::get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) return {};
    return it->second;
}

bool DimensionSet::has(const std::string& name) const {
    return values_.contains(name);
}

size_t DimensionSet::size() const noexcept {
    size_t total = 0;
    for (const auto& [name, values] : values_) total += values.size();
    return total;
}

bool dimension_value_matches(const std::string& job_value, const std::string& device_value) {
    if (job_value.starts_with(dimension::kRegexPrefix)) {
        try {
            std::regex pattern(job_value.substr(dimension::kRegexPrefix.size()));
            return std::regex_match(device_value, pattern);
        } catch (const std::regex_error&) {
            // A malformed pattern never matches.
            return false;
        }
    }
    return equals_ignore_case(job_value, device_value);
}

namespace {

bool any_value_matches(const std::vector<std::string>& values, const std::string& job_value) {
    return std::any_of(values.begin(), values.end(), [&](const std::string& v) {
        return dimension_value_matches(job_value, v);
    });
}

}  // anonymous namespace

JobDimensions DeviceDimensions::unsupported_job_dimensions(
    const JobDimensions& job_dimensions) const {
    JobDimensions unsupported;
    for (const auto& [name, job_value] : job_dimensions) {
        if (any_value_matches(supported.get(name), job_value)) continue;
        if (any_value_matches(required.get(name), job_value)) continue;
        unsupported.emplace(name, job_value);
    }
    return unsupported;
}

std::map<std::string, std::set<std::string>> DeviceDimensions::unsatisfied_device_dimensions(
    const JobDimensions& job_dimensions) const {
    std::map<std::string, std::set<std::string>> unsatisfied;
    for (const auto& [name, values] : required.all()) {
        auto it = job_dimensions.find(name);
        for (const auto& value : values) {
            if (it == job_dimensions.end() || !dimension_value_matches(it->second, value)) {
                unsatisfied[name].insert(value);
            }
        }
    }
    return unsatisfied;
}

std::set<std::string> DeviceInfo::unsupported_decorators(
    const std::set<std::string>& requested) const {
    std::set<std::string> unsupported;
    std::set_difference(requested.begin(), requested.end(),
                        decorators.begin(), decorators.end(),
                        std::inserter(unsupported, unsupported.begin()));
    return unsupported;
}

}  // namespace lab_alloc
