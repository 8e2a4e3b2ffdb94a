/**
 * @file types.hpp
 * @brief Fundamental types used throughout LabAllocDiag.
 *
 * Defines identifier aliases, time aliases and the small enums shared by the
 * schedule-unit model, the failed-device table and the diagnostician.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lab_alloc {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobId = std::string;
using TestId = std::string;
using DeviceId = std::string;       ///< Device serial or universal id (serial@lab_ip)
using ControlId = std::string;      ///< Id used by the lab to control a device
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Priorities
// ─────────────────────────────────────────────

enum class Priority : uint8_t {
    Min,
    Low,
    Default,
    High,
    Max
};

[[nodiscard]] constexpr std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::Min:     return "min";
        case Priority::Low:     return "low";
        case Priority::Default: return "default";
        case Priority::High:    return "high";
        case Priority::Max:     return "max";
    }
    return "unknown";
}

/**
 * @brief Priority of a job when competing with other jobs for the same device.
 */
enum class DeviceAllocationPriority : uint8_t {
    Default,
    Low,
    High
};

[[nodiscard]] constexpr std::string_view to_string(DeviceAllocationPriority priority) noexcept {
    switch (priority) {
        case DeviceAllocationPriority::Default: return "default";
        case DeviceAllocationPriority::Low:     return "low";
        case DeviceAllocationPriority::High:    return "high";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Device Status
// ─────────────────────────────────────────────

enum class DeviceStatus : uint8_t {
    Idle,
    Busy,
    Init,
    Dying,
    Lameduck,
    Failed,
    Missing,
    Prepping,
    Dirty
};

[[nodiscard]] constexpr std::string_view to_string(DeviceStatus status) noexcept {
    switch (status) {
        case DeviceStatus::Idle:     return "IDLE";
        case DeviceStatus::Busy:     return "BUSY";
        case DeviceStatus::Init:     return "INIT";
        case DeviceStatus::Dying:    return "DYING";
        case DeviceStatus::Lameduck: return "LAMEDUCK";
        case DeviceStatus::Failed:   return "FAILED";
        case DeviceStatus::Missing:  return "MISSING";
        case DeviceStatus::Prepping: return "PREPPING";
        case DeviceStatus::Dirty:    return "DIRTY";
    }
    return "UNKNOWN";
}

/**
 * @brief Case-insensitive parse of a device status name.
 */
[[nodiscard]] std::optional<DeviceStatus> parse_device_status(std::string_view name);

/// ASCII lower-casing used for case-insensitive names.
[[nodiscard]] std::string to_lower(std::string_view text);

[[nodiscard]] bool equals_ignore_case(std::string_view a, std::string_view b) noexcept;

}  // namespace lab_alloc
