/**
 * @file dimension.hpp
 * @brief Well-known dimension names and values.
 */

#pragma once

#include <string_view>

namespace lab_alloc::dimension {

namespace name {
inline constexpr std::string_view kId = "id";
inline constexpr std::string_view kLabel = "label";
inline constexpr std::string_view kHostIp = "host_ip";
inline constexpr std::string_view kHostName = "host_name";
inline constexpr std::string_view kPoolName = "pool_name";
inline constexpr std::string_view kSimCardInfo = "sim_card_info";
}  // namespace name

namespace value {
inline constexpr std::string_view kNoSim = "no_sim";
inline constexpr std::string_view kDefaultPoolName = "shared";
/// Location value reported when a host dimension is absent.
inline constexpr std::string_view kUnknown = "unknown";
}  // namespace value

/// Job dimension values with this prefix are full-match regular expressions.
inline constexpr std::string_view kRegexPrefix = "regex:";

/// Owner assigned to devices nobody has claimed yet.
inline constexpr std::string_view kDeviceDefaultOwner = "lab-device-default-owner";

}  // namespace lab_alloc::dimension
