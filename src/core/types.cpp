/**
 * @file types.cpp
 * @brief String helpers for the shared vocabulary types.
 */

#include "core/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace lab_alloc {

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool equals_ignore_case(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i]))
            != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<DeviceStatus> parse_device_status(std::string_view name) {
    constexpr std::array kAll = {
        DeviceStatus::Idle,   DeviceStatus::Busy,    DeviceStatus::Init,
        DeviceStatus::Dying,  DeviceStatus::Lameduck, DeviceStatus::Failed,
        DeviceStatus::Missing, DeviceStatus::Prepping, DeviceStatus::Dirty
    };
    for (auto status : kAll) {
        if (equals_ignore_case(name, to_string(status))) return status;
    }
    return std::nullopt;
}

}  // namespace lab_alloc
