/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: flyscan_demo, drives a spin flyer over simulated hardware

**************************************************/

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/utils/argsview.hpp"

#include "config/config_loader.hpp"
#include "device/common/device_exceptions.hpp"
#include "device/flyer/spin_flyer.hpp"
#include "device/template/mock/mock_actuator.hpp"
#include "device/template/mock/mock_busy_flag.hpp"
#include "device/template/mock/mock_capture_device.hpp"
#include "logging/logging_session.hpp"

namespace fs = std::filesystem;
using namespace std::string_literals;

namespace {

struct SimulatedHardware {
    flyscan::device::MockActuator actuator;
    flyscan::device::MockCaptureDevice capture;
    flyscan::device::MockBusyFlag busy;

    explicit SimulatedHardware(const flyscan::config::SimulationConfig& sim)
        : actuator(sim.actuatorName, sim.initialPosition),
          capture(sim.captureName, sim.fileDirectory, sim.filePrefix),
          busy(sim.busyFlagName) {
        actuator.setVelocity(sim.velocity);
        capture.setWriteDuration(std::chrono::milliseconds(sim.writeDurationMs));
        capture.setFramePeriod(std::chrono::milliseconds(sim.framePeriodMs));
    }
};

void printRecords(flyscan::device::RecordStream stream) {
    while (auto record = stream.next()) {
        std::cout << record->toJson().dump() << std::endl;
    }
}

void awaitCommand(flyscan::device::SpinFlyer& flyer,
                  const std::string& command) {
    auto status = flyer.set(command);
    status->wait();
    status->rethrowIfFailed();
    spdlog::info("Command '{}' done, actuator state {}", command,
                 flyscan::device::acquisitionStateToString(flyer.state()));
}

int runFlyPlan(flyscan::device::SpinFlyer& flyer) {
    std::cout << flyer.describeCollect().dump(2) << std::endl;
    flyer.kickoff();
    auto status = flyer.complete();
    spdlog::info("Fly scan resolved after {} ms", status->elapsed().count());
    // Rethrows the error of a failed run
    printRecords(flyer.collect());
    return 0;
}

int runCommandPlan(flyscan::device::SpinFlyer& flyer,
                   flyscan::device::MockActuator& actuator) {
    const double origin = actuator.getPosition();
    for (const auto* command : {"taxi", "fly", "return"}) {
        awaitCommand(flyer, command);
    }
    spdlog::info("Round trip {} -> {}", origin, actuator.getPosition());
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    atom::utils::ArgumentParser program("flyscan_demo"s);

    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Path to the config file", {"c"});
    program.addArgument("plan", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "fly"s, "Plan to run (fly/commands)", {"p"});
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Log level (trace/debug/info/warn/error)", {"l"});

    program.addDescription("Spin flyer demo over simulated hardware:");
    program.addEpilog("End.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    flyscan::config::FlyscanConfig config;
    try {
        auto configPath = program.get<std::string>("config").value_or(""s);
        if (!configPath.empty()) {
            config = flyscan::config::ConfigLoader::load(fs::path(configPath));
        }
    } catch (const flyscan::config::BadConfigException& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    auto cmdLogLevel = program.get<std::string>("log-level");
    if (cmdLogLevel && !cmdLogLevel->empty()) {
        if (!flyscan::logging::parseLevel(*cmdLogLevel)) {
            std::cerr << "Unknown log level: " << *cmdLogLevel << std::endl;
            return 1;
        }
        config.logging.level = *cmdLogLevel;
    }

    std::optional<flyscan::logging::LoggingSession> logging;
    try {
        logging.emplace(config.logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to set up logging: " << e.what() << std::endl;
        return 1;
    }

    int exitCode = 0;
    try {
        SimulatedHardware hardware(config.simulation);
        flyscan::device::SpinFlyer flyer("flyer", hardware.actuator,
                                         hardware.capture, hardware.busy,
                                         config.flyer);

        const auto plan = program.get<std::string>("plan").value_or("fly"s);
        if (plan == "fly") {
            exitCode = runFlyPlan(flyer);
        } else if (plan == "commands") {
            exitCode = runCommandPlan(flyer, hardware.actuator);
        } else {
            spdlog::error("Unknown plan '{}', expected fly or commands", plan);
            exitCode = 2;
        }
    } catch (const flyscan::device::DeviceException& e) {
        spdlog::error("Plan aborted: {}", e.error().toString());
        exitCode = 1;
    }

    return exitCode;
}
