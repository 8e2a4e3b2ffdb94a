/**
 * @file scenario_loader.hpp
 * @brief Replayable allocation scenarios: a waiting job, the lab inventory
 *        and recorded init failures, read from TOML.
 */

#pragma once

#include "core/result.hpp"
#include "device/device_query.hpp"
#include "model/schedule_unit.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lab_alloc {

struct InitFailure {
    ControlId control_id;
    uint32_t count{1};
};

struct Scenario {
    JobScheduleUnit::Params job;
    std::vector<QueryDeviceInfo> devices;
    std::vector<InitFailure> init_failures;
};

/**
 * @brief Loads a scenario file.
 *
 * The [job] table is mandatory; [[device]] and [[init_failure]] entries are
 * optional. A device without an id, or an init failure without a
 * control_id, is a ParseError.
 */
Result<Scenario> load_scenario(const std::filesystem::path& path);

/// Same as load_scenario() on an in-memory document.
Result<Scenario> parse_scenario(std::string_view toml_text);

}  // namespace lab_alloc
