/**
 * @file device_filter.cpp
 * @brief DeviceFilter implementation.
 */

#include "device/device_filter.hpp"

#include <regex>

namespace lab_alloc {

namespace {

/// Escapes regex metacharacters so a device type matches literally.
std::string quote_regex(const std::string& literal) {
    static const std::regex kSpecial(R"([.^$|()\[\]{}*+?\\])");
    return std::regex_replace(literal, kSpecial, R"(\$&)");
}

}  // anonymous namespace

DeviceQueryFilter DeviceFilter::filter_for(const JobScheduleUnit& job) const {
    DeviceQueryFilter filter;
    if (!job.device_type().empty()) {
        filter.type_regex.push_back(quote_regex(job.device_type()));
    }
    filter.dimension_filters = extra_dimension_filters_;
    return filter;
}

}  // namespace lab_alloc
