/**
 * @file scenario_loader.cpp
 * @brief Scenario loading from TOML files using toml++.
 */

#include "device/scenario_loader.hpp"

#include <toml++/toml.hpp>

#include <sstream>

namespace lab_alloc {

namespace {

std::vector<std::string> string_array(toml::node_view<const toml::node> node) {
    std::vector<std::string> values;
    if (const auto* array = node.as_array()) {
        for (const auto& element : *array) {
            if (auto value = element.value<std::string>()) values.push_back(*value);
        }
    }
    return values;
}

Result<JobScheduleUnit::Params> parse_job(const toml::table& job) {
    auto id = job["id"].value<std::string>();
    if (!id || id->empty()) {
        return Error{ErrorCode::ParseError, "[job] requires a non-empty id"};
    }

    JobScheduleUnit::Params params;
    params.locator = JobLocator{*id, job["name"].value_or(*id)};
    auto run_as = job["run_as"].value_or(std::string{});
    params.user = JobUser{run_as, job["actual_user"].value_or(run_as)};
    params.driver = job["driver"].value_or(std::string{});
    params.device_type = job["device_type"].value<std::string>();
    params.decorators = string_array(job["decorators"]);
    if (const auto* dimensions = job["dimensions"].as_table()) {
        for (const auto& [name, value] : *dimensions) {
            auto text = value.value<std::string>();
            if (!text) {
                return Error{ErrorCode::ParseError,
                             "[job.dimensions] " + std::string{name.str()} + " must be a string"};
            }
            params.dimensions.emplace(std::string{name.str()}, *text);
        }
    }

    auto shared_names = string_array(job["shared_dimension_names"]);
    if (!shared_names.empty() && params.device_type) {
        params.device_requirements = DeviceRequirements{
            {DeviceRequirement{*params.device_type, params.decorators, params.dimensions}},
            std::move(shared_names)};
    }

    params.timeout.start_timeout = std::chrono::seconds(job["start_timeout_sec"].value_or(int64_t{0}));
    params.timeout.job_timeout = std::chrono::seconds(job["job_timeout_sec"].value_or(int64_t{0}));
    params.timeout.test_timeout = std::chrono::seconds(job["test_timeout_sec"].value_or(int64_t{0}));
    params.allocation_exit_strategy = job["allocation_exit_strategy"].value_or(std::string{});
    return params;
}

Result<QueryDeviceInfo> parse_device(const toml::table& device, size_t index) {
    auto id = device["id"].value<std::string>();
    if (!id || id->empty()) {
        return Error{ErrorCode::ParseError,
                     "[[device]] #" + std::to_string(index) + " requires a non-empty id"};
    }

    QueryDeviceInfo info;
    info.id = *id;
    info.status = device["status"].value_or(std::string{"IDLE"});
    info.owners = string_array(device["owners"]);
    info.types = string_array(device["types"]);
    info.drivers = string_array(device["drivers"]);
    info.decorators = string_array(device["decorators"]);
    if (const auto* dimensions = device["dimension"].as_array()) {
        for (const auto& node : *dimensions) {
            const auto* dimension = node.as_table();
            if (!dimension) continue;
            auto name = (*dimension)["name"].value<std::string>();
            if (!name) {
                return Error{ErrorCode::ParseError, "Dimension of device " + info.id + " has no name"};
            }
            info.dimensions.push_back(QueryDimension{*name,
                                                     (*dimension)["value"].value_or(std::string{}),
                                                     (*dimension)["required"].value_or(false)});
        }
    }
    return info;
}

Result<Scenario> build_scenario(const toml::table& tbl) {
    const auto* job = tbl["job"].as_table();
    if (!job) {
        return Error{ErrorCode::ParseError, "Scenario has no [job] table"};
    }
    auto params = parse_job(*job);
    if (!params) return params.error();

    Scenario scenario;
    scenario.job = std::move(params).value();

    if (const auto* devices = tbl["device"].as_array()) {
        size_t index = 0;
        for (const auto& node : *devices) {
            const auto* device = node.as_table();
            if (!device) continue;
            auto info = parse_device(*device, index++);
            if (!info) return info.error();
            scenario.devices.push_back(std::move(info).value());
        }
    }

    if (const auto* failures = tbl["init_failure"].as_array()) {
        for (const auto& node : *failures) {
            const auto* failure = node.as_table();
            if (!failure) continue;
            auto control_id = (*failure)["control_id"].value<std::string>();
            if (!control_id) {
                return Error{ErrorCode::ParseError, "[[init_failure]] requires a control_id"};
            }
            auto count = (*failure)["count"].value_or(int64_t{1});
            if (count < 1) {
                return Error{ErrorCode::InvalidArgument,
                             "[[init_failure]] count must be >= 1 for " + *control_id};
            }
            scenario.init_failures.push_back(InitFailure{*control_id, static_cast<uint32_t>(count)});
        }
    }
    return scenario;
}

}  // anonymous namespace

Result<Scenario> load_scenario(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Scenario file not found: " + path.string()};
    }
    try {
        return build_scenario(toml::parse_file(path.string()));
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "TOML parse error in " << path.string() << ": " << err.description()
            << " (" << err.source().begin << ")";
        return Error{ErrorCode::ParseError, oss.str()};
    }
}

Result<Scenario> parse_scenario(std::string_view toml_text) {
    try {
        return build_scenario(toml::parse(toml_text));
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

}  // namespace lab_alloc
