/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Loads the flyscan configuration document from disk

**************************************************/

#ifndef FLYSCAN_CONFIG_CONFIG_LOADER_HPP
#define FLYSCAN_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>
#include <string>

#include "core/exception.hpp"
#include "sections/flyer_config.hpp"
#include "sections/logging_config.hpp"
#include "sections/simulation_config.hpp"

namespace flyscan::config {

/**
 * @brief Whole configuration document
 *
 * Layout: {"flyer": {...}, "simulation": {...}, "logging": {...}}. Missing
 * sections take their defaults.
 */
struct FlyscanConfig {
    FlyerConfig flyer;
    SimulationConfig simulation;
    LoggingConfig logging;

    [[nodiscard]] json toJson() const;
};

class ConfigLoader {
public:
    /**
     * @brief Parse a JSON document, `//` and block comments are allowed
     * @throws ConfigIOException if the file cannot be read
     * @throws ConfigSerializationException on a syntax error
     */
    [[nodiscard]] static json readJsonFile(const std::filesystem::path& path);

    /**
     * @brief Build and validate the configuration from a parsed document
     * @throws ConfigSerializationException on type mismatches
     * @throws ConfigValidationException if a section is out of range
     */
    [[nodiscard]] static FlyscanConfig fromJson(const json& document);

    /**
     * @brief readJsonFile() followed by fromJson()
     */
    [[nodiscard]] static FlyscanConfig load(const std::filesystem::path& path);
};

}  // namespace flyscan::config

#endif  // FLYSCAN_CONFIG_CONFIG_LOADER_HPP
