/**
 * @file main.cpp
 * @brief lab_alloc_diag entry point.
 *
 * Replays an allocation scenario through the diagnostic pipeline:
 *   Config → Logger → Scenario → JobRegistry → FailedDeviceTable → Querier → Diagnostician
 */

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "device/device_query.hpp"
#include "device/failed_device_table.hpp"
#include "device/scenario_loader.hpp"
#include "diagnostic/single_device_diagnostician.hpp"
#include "scheduler/job_registry.hpp"
#include "telemetry/json_sink.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace lab_alloc;

namespace {

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::filesystem::path scenario_path;
    int passes = 1;
};

void print_usage(std::ostream& out) {
    out << "Usage: lab_alloc_diag --scenario <path> [OPTIONS]\n"
        << "  --config <path>    Configuration file (default: built-in defaults)\n"
        << "  --scenario <path>  Scenario file with the job, devices and init failures\n"
        << "  --passes <n>       Diagnose passes to run (default: 1)\n"
        << "  --help, -h         Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--scenario" && i + 1 < argc) {
            args.scenario_path = argv[++i];
        } else if (arg == "--passes" && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                args.passes = std::stoi(value);
            } catch (const std::exception&) {
                return Error{ErrorCode::InvalidArgument, "--passes expects a number, got " + value};
            }
            if (args.passes < 1) {
                return Error{ErrorCode::InvalidArgument, "--passes must be >= 1"};
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            std::exit(0);
        } else {
            return Error{ErrorCode::InvalidArgument, "Unknown argument: " + arg};
        }
    }
    if (args.scenario_path.empty()) {
        return Error{ErrorCode::InvalidArgument, "--scenario is required"};
    }
    return args;
}

/// Devices quarantined by the table are invisible to the diagnostician.
std::vector<QueryDeviceInfo> visible_devices(const std::vector<QueryDeviceInfo>& devices,
                                             FailedDeviceTable& failed_devices,
                                             Logger& logger) {
    auto failed = failed_devices.failed_device_ids();
    std::vector<QueryDeviceInfo> visible;
    for (const auto& device : devices) {
        if (failed.contains(device.id)) {
            logger.warn(std::format("Device {} is quarantined after {} init failures", device.id,
                                    failed_devices.failure_count(device.id)));
            continue;
        }
        visible.push_back(device);
    }
    return visible;
}

void print_result(const DiagnosticResult& result) {
    std::cout << "Error: " << to_string(result.error_id) << "\n" << result.message << "\n";
    if (result.cause) {
        std::cout << "Cause: " << to_string(result.cause->error_id) << "\n"
                  << result.cause->message << "\n";
    }
}

int run(const CLIArgs& args, const Config& config, Logger& logger) {
    auto scenario = load_scenario(args.scenario_path);
    if (!scenario) {
        logger.error(std::format("Failed to load scenario: {}", scenario.error().describe()));
        std::cerr << "Failed to load scenario: " << scenario.error().message << std::endl;
        return 1;
    }

    SystemClock clock;
    auto unit = JobScheduleUnit::create(scenario->job, clock);
    if (!unit) {
        std::cerr << "Invalid job: " << unit.error().message << std::endl;
        return 1;
    }
    auto job = std::make_shared<const JobScheduleUnit>(std::move(unit).value());

    JobRegistry registry(logger);
    if (auto added = registry.add_job(job); !added) {
        std::cerr << added.error().message << std::endl;
        return 1;
    }

    // ── Quarantine ───────────────────────────
    FailedDeviceTable failed_devices(config.failed_device_table, clock, logger);
    for (const auto& failure : scenario->init_failures) {
        for (uint32_t i = 0; i < failure.count; ++i) {
            failed_devices.add(failure.control_id);
        }
    }
    InMemoryDeviceQuerier querier(visible_devices(scenario->devices, failed_devices, logger));

    // ── Diagnose ─────────────────────────────
    SingleDeviceDiagnostician diagnostician(job, querier, logger, config.diagnostic);
    std::shared_ptr<const SingleDeviceReport> report;
    for (int pass = 0; pass < args.passes; ++pass) {
        auto diagnosed = diagnostician.diagnose_job(/*no_perfect_candidate=*/false);
        if (!diagnosed) {
            std::cerr << "Diagnose failed: " << diagnosed.error().message << std::endl;
            return 1;
        }
        report = std::move(diagnosed).value();
    }

    print_result(report->result());
    diagnostician.log_extra_info();
    if (diagnostician.has_device_matched_requirement_but_busy()) {
        logger.info(std::format("Some device matches every requirement of {} but is busy",
                                job->locator().to_string()));
    }
    registry.remove_job(job->locator().id);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << args.error().message << "\n";
        print_usage(std::cerr);
        return 1;
    }

    auto config = default_config();
    if (args->config_path) {
        auto loaded = load_config(*args->config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().message << std::endl;
            return 1;
        }
        config = std::move(loaded).value();
    }

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << level.error().message << std::endl;
        return 1;
    }
    auto sink = make_log_sink(config.telemetry, "lab_alloc_diag");
    if (!sink) {
        std::cerr << "Failed to create log sink: " << sink.error().message << std::endl;
        return 1;
    }
    Logger logger(std::move(sink).value(), *level);
    logger.info(std::format("lab_alloc_diag starting, scenario {}", args->scenario_path.string()));

    int status = run(*args, config, logger);
    logger.flush();
    return status;
}
