/*
 * simulation_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Simulated hardware configuration used by the demo

**************************************************/

#ifndef FLYSCAN_CONFIG_SECTIONS_SIMULATION_CONFIG_HPP
#define FLYSCAN_CONFIG_SECTIONS_SIMULATION_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace flyscan::config {

/**
 * @brief Parameters of the simulated actuator, capture device and busy record
 */
struct SimulationConfig : ConfigSection<SimulationConfig> {
    static constexpr std::string_view PATH = "/flyscan/simulation";

    // Actuator
    std::string actuatorName{"m1"};
    double initialPosition{0.0};
    double velocity{0.0};  ///< Units per second, 0 moves instantly

    // Capture device
    std::string captureName{"simdet"};
    std::string fileDirectory{"/tmp/flyscan"};
    std::string filePrefix{"spin"};
    int writeDurationMs{20};
    int framePeriodMs{10};

    // Busy record
    std::string busyFlagName{"mybusy"};

    [[nodiscard]] json serialize() const {
        return {{"actuatorName", actuatorName},
                {"initialPosition", initialPosition},
                {"velocity", velocity},
                {"captureName", captureName},
                {"fileDirectory", fileDirectory},
                {"filePrefix", filePrefix},
                {"writeDurationMs", writeDurationMs},
                {"framePeriodMs", framePeriodMs},
                {"busyFlagName", busyFlagName}};
    }

    [[nodiscard]] static SimulationConfig deserialize(const json& j) {
        SimulationConfig cfg;
        cfg.actuatorName = j.value("actuatorName", cfg.actuatorName);
        cfg.initialPosition = j.value("initialPosition", cfg.initialPosition);
        cfg.velocity = j.value("velocity", cfg.velocity);
        cfg.captureName = j.value("captureName", cfg.captureName);
        cfg.fileDirectory = j.value("fileDirectory", cfg.fileDirectory);
        cfg.filePrefix = j.value("filePrefix", cfg.filePrefix);
        cfg.writeDurationMs = j.value("writeDurationMs", cfg.writeDurationMs);
        cfg.framePeriodMs = j.value("framePeriodMs", cfg.framePeriodMs);
        cfg.busyFlagName = j.value("busyFlagName", cfg.busyFlagName);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        const SimulationConfig defaults;
        json schema{{"type", "object"}};
        addSchemaProperty(schema, "actuatorName", "string",
                          defaults.actuatorName);
        addSchemaProperty(schema, "initialPosition", "number",
                          defaults.initialPosition);
        addSchemaProperty(schema, "velocity", "number", defaults.velocity,
                          "Simulated speed in units per second");
        addRange(schema, "velocity", 0.0);
        addSchemaProperty(schema, "captureName", "string",
                          defaults.captureName);
        addSchemaProperty(schema, "fileDirectory", "string",
                          defaults.fileDirectory);
        addSchemaProperty(schema, "filePrefix", "string", defaults.filePrefix);
        addSchemaProperty(schema, "writeDurationMs", "integer",
                          defaults.writeDurationMs);
        addRange(schema, "writeDurationMs", 0);
        addSchemaProperty(schema, "framePeriodMs", "integer",
                          defaults.framePeriodMs);
        addRange(schema, "framePeriodMs", 1);
        addSchemaProperty(schema, "busyFlagName", "string",
                          defaults.busyFlagName);
        return schema;
    }

    void validateFields(ConfigValidationResult& result) const {
        const std::string base(PATH);
        if (velocity < 0.0) {
            result.addError(base + "/velocity", "must not be negative",
                            "minimum");
        }
        if (writeDurationMs < 0) {
            result.addError(base + "/writeDurationMs", "must not be negative",
                            "minimum");
        }
        if (framePeriodMs < 1) {
            result.addError(base + "/framePeriodMs", "must be positive",
                            "minimum");
        }
        if (actuatorName.empty() || captureName.empty() ||
            busyFlagName.empty()) {
            result.addError(base, "device names must not be empty",
                            "minLength");
        }
    }
};

}  // namespace flyscan::config

#endif  // FLYSCAN_CONFIG_SECTIONS_SIMULATION_CONFIG_HPP
