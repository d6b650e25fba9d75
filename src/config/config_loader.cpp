/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_loader.hpp"

#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>

namespace flyscan::config {

namespace {

template <typename Section>
Section loadSection(const json& document, const char* key) {
    if (!document.contains(key)) {
        return Section::defaults();
    }
    const auto& node = document.at(key);
    if (!node.is_object()) {
        THROW_CONFIG_SERIALIZATION_EXCEPTION(
            std::string("Section '") + key + "' must be an object");
    }

    Section section;
    try {
        section = Section::fromJson(node);
    } catch (const json::exception& e) {
        THROW_CONFIG_SERIALIZATION_EXCEPTION(
            std::string("Invalid value in section '") + key + "': " + e.what());
    }

    auto validation = section.validate();
    if (!validation) {
        THROW_CONFIG_VALIDATION_EXCEPTION(validation.summary());
    }
    return section;
}

}  // namespace

json FlyscanConfig::toJson() const {
    return {{"flyer", flyer.toJson()},
            {"simulation", simulation.toJson()},
            {"logging", logging.toJson()}};
}

json ConfigLoader::readJsonFile(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        THROW_CONFIG_IO_EXCEPTION("Failed to open file: " + path.string());
    }

    std::string text((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
    if (text.empty()) {
        THROW_CONFIG_IO_EXCEPTION("Config file is empty: " + path.string());
    }

    try {
        return json::parse(text, nullptr, true, true);
    } catch (const json::parse_error& e) {
        THROW_CONFIG_SERIALIZATION_EXCEPTION("Failed to parse file: " +
                                             path.string() + ", " + e.what());
    }
}

FlyscanConfig ConfigLoader::fromJson(const json& document) {
    if (!document.is_object()) {
        THROW_CONFIG_SERIALIZATION_EXCEPTION(
            "Configuration document must be an object");
    }

    FlyscanConfig config;
    config.flyer = loadSection<FlyerConfig>(document, "flyer");
    config.simulation = loadSection<SimulationConfig>(document, "simulation");
    config.logging = loadSection<LoggingConfig>(document, "logging");
    return config;
}

FlyscanConfig ConfigLoader::load(const std::filesystem::path& path) {
    auto config = fromJson(readJsonFile(path));
    spdlog::info("Config loaded from file: {}", path.string());
    return config;
}

}  // namespace flyscan::config
