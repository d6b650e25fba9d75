/*
 * flyer_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Spin flyer (fly scan controller) configuration

**************************************************/

#ifndef FLYSCAN_CONFIG_SECTIONS_FLYER_CONFIG_HPP
#define FLYSCAN_CONFIG_SECTIONS_FLYER_CONFIG_HPP

#include <chrono>
#include <string>

#include "../core/config_section.hpp"

namespace flyscan::config {

/**
 * @brief Spin flyer configuration
 *
 * Positions are in actuator user units. The taxi position is
 * startPosition + preStartOffset, far enough before the nominal start for
 * the stage to reach steady speed.
 */
struct FlyerConfig : ConfigSection<FlyerConfig> {
    /// Configuration path
    static constexpr std::string_view PATH = "/flyscan/flyer";

    double preStartOffset{-0.5};        ///< Run-up distance before start
    double startPosition{-20.0};        ///< Nominal scan start
    double finishPosition{20.0};        ///< Scan end (fly target)
    int pollIntervalMs{50};             ///< complete() polling period
    int numCycles{1};                   ///< Spins per kickoff
    int maxFrames{10000};               ///< Frames per capture file
    int fileWritePollMs{10};            ///< Write-status polling period
    int fileWriteTimeoutMs{60000};      ///< Bound on the file write wait
    int completeTimeoutMs{600000};      ///< Bound on complete()
    std::string streamName{"spin_flyer_stream"};  ///< Event stream name

    [[nodiscard]] double taxiPosition() const {
        return startPosition + preStartOffset;
    }

    [[nodiscard]] std::chrono::milliseconds pollInterval() const {
        return std::chrono::milliseconds(pollIntervalMs);
    }

    [[nodiscard]] std::chrono::milliseconds fileWritePollInterval() const {
        return std::chrono::milliseconds(fileWritePollMs);
    }

    [[nodiscard]] json serialize() const {
        return {{"preStartOffset", preStartOffset},
                {"startPosition", startPosition},
                {"finishPosition", finishPosition},
                {"pollIntervalMs", pollIntervalMs},
                {"numCycles", numCycles},
                {"maxFrames", maxFrames},
                {"fileWritePollMs", fileWritePollMs},
                {"fileWriteTimeoutMs", fileWriteTimeoutMs},
                {"completeTimeoutMs", completeTimeoutMs},
                {"streamName", streamName}};
    }

    [[nodiscard]] static FlyerConfig deserialize(const json& j) {
        FlyerConfig cfg;
        cfg.preStartOffset = j.value("preStartOffset", cfg.preStartOffset);
        cfg.startPosition = j.value("startPosition", cfg.startPosition);
        cfg.finishPosition = j.value("finishPosition", cfg.finishPosition);
        cfg.pollIntervalMs = j.value("pollIntervalMs", cfg.pollIntervalMs);
        cfg.numCycles = j.value("numCycles", cfg.numCycles);
        cfg.maxFrames = j.value("maxFrames", cfg.maxFrames);
        cfg.fileWritePollMs = j.value("fileWritePollMs", cfg.fileWritePollMs);
        cfg.fileWriteTimeoutMs =
            j.value("fileWriteTimeoutMs", cfg.fileWriteTimeoutMs);
        cfg.completeTimeoutMs =
            j.value("completeTimeoutMs", cfg.completeTimeoutMs);
        cfg.streamName = j.value("streamName", cfg.streamName);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        const FlyerConfig defaults;
        json schema{{"type", "object"}};
        addSchemaProperty(schema, "preStartOffset", "number",
                          defaults.preStartOffset,
                          "Run-up distance added to the start position");
        addSchemaProperty(schema, "startPosition", "number",
                          defaults.startPosition, "Nominal scan start");
        addSchemaProperty(schema, "finishPosition", "number",
                          defaults.finishPosition, "Scan end position");
        addSchemaProperty(schema, "pollIntervalMs", "integer",
                          defaults.pollIntervalMs);
        addRange(schema, "pollIntervalMs", 1);
        addSchemaProperty(schema, "numCycles", "integer", defaults.numCycles,
                          "Acquisition cycles per kickoff");
        addRange(schema, "numCycles", 1);
        addSchemaProperty(schema, "maxFrames", "integer", defaults.maxFrames);
        addRange(schema, "maxFrames", 1);
        addSchemaProperty(schema, "fileWritePollMs", "integer",
                          defaults.fileWritePollMs);
        addRange(schema, "fileWritePollMs", 1);
        addSchemaProperty(schema, "fileWriteTimeoutMs", "integer",
                          defaults.fileWriteTimeoutMs);
        addRange(schema, "fileWriteTimeoutMs", 1);
        addSchemaProperty(schema, "completeTimeoutMs", "integer",
                          defaults.completeTimeoutMs);
        addRange(schema, "completeTimeoutMs", 1);
        addSchemaProperty(schema, "streamName", "string", defaults.streamName);
        return schema;
    }

    void validateFields(ConfigValidationResult& result) const {
        const std::string base(PATH);
        if (numCycles < 1) {
            result.addError(base + "/numCycles", "must be at least 1",
                            "minimum");
        }
        if (maxFrames < 1) {
            result.addError(base + "/maxFrames", "must be at least 1",
                            "minimum");
        }
        if (pollIntervalMs < 1) {
            result.addError(base + "/pollIntervalMs", "must be positive",
                            "minimum");
        }
        if (fileWritePollMs < 1) {
            result.addError(base + "/fileWritePollMs", "must be positive",
                            "minimum");
        }
        if (fileWriteTimeoutMs < 1) {
            result.addError(base + "/fileWriteTimeoutMs", "must be positive",
                            "minimum");
        }
        if (completeTimeoutMs < 1) {
            result.addError(base + "/completeTimeoutMs", "must be positive",
                            "minimum");
        }
        if (streamName.empty()) {
            result.addError(base + "/streamName", "must not be empty",
                            "minLength");
        }
    }
};

}  // namespace flyscan::config

#endif  // FLYSCAN_CONFIG_SECTIONS_FLYER_CONFIG_HPP
