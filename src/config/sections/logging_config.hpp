/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Log output settings of flyscan_demo

**************************************************/

#ifndef FLYSCAN_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define FLYSCAN_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

#include "../core/config_section.hpp"

namespace flyscan::config {

/// Level names accepted in the "level" key
inline constexpr std::array<std::string_view, 8> kLogLevelNames = {
    "trace", "debug", "info", "warn", "warning", "error", "critical", "off"};

[[nodiscard]] inline bool isLogLevelName(std::string_view name) {
    return std::find(kLogLevelNames.begin(), kLogLevelNames.end(), name) !=
           kLogLevelNames.end();
}

/**
 * @brief Console and rotating file output
 *
 * An empty file path disables the file output. At least one output must be
 * enabled.
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    /// Configuration path
    static constexpr std::string_view PATH = "/flyscan/logging";

    std::string level{"info"};
    std::string pattern{"[%H:%M:%S.%e] [%^%l%$] [%t] %v"};
    bool console{true};
    std::string file;           ///< Rotating log file, empty for none
    int maxFileSizeKb{1024};    ///< Rotation threshold
    int maxFiles{3};            ///< Rotated files kept

    [[nodiscard]] json serialize() const {
        return {{"level", level},
                {"pattern", pattern},
                {"console", console},
                {"file", file},
                {"maxFileSizeKb", maxFileSizeKb},
                {"maxFiles", maxFiles}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.console = j.value("console", cfg.console);
        cfg.file = j.value("file", cfg.file);
        cfg.maxFileSizeKb = j.value("maxFileSizeKb", cfg.maxFileSizeKb);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        const LoggingConfig defaults;
        json schema{{"type", "object"}};
        addSchemaProperty(schema, "level", "string", defaults.level);
        json levels = json::array();
        for (auto name : kLogLevelNames) {
            levels.push_back(std::string(name));
        }
        schema["properties"]["level"]["enum"] = levels;
        addSchemaProperty(schema, "pattern", "string", defaults.pattern,
                          "spdlog pattern");
        addSchemaProperty(schema, "console", "boolean", defaults.console);
        addSchemaProperty(schema, "file", "string", defaults.file);
        addSchemaProperty(schema, "maxFileSizeKb", "integer",
                          defaults.maxFileSizeKb);
        addRange(schema, "maxFileSizeKb", 1);
        addSchemaProperty(schema, "maxFiles", "integer", defaults.maxFiles);
        addRange(schema, "maxFiles", 1);
        return schema;
    }

    void validateFields(ConfigValidationResult& result) const {
        const std::string base(PATH);
        if (!isLogLevelName(level)) {
            result.addError(base + "/level", "unknown level '" + level + "'",
                            "enum");
        }
        if (!console && file.empty()) {
            result.addError(base, "no log output enabled", "required");
        }
        if (maxFileSizeKb < 1) {
            result.addError(base + "/maxFileSizeKb", "must be positive",
                            "minimum");
        }
        if (maxFiles < 1) {
            result.addError(base + "/maxFiles", "must be at least 1",
                            "minimum");
        }
    }
};

}  // namespace flyscan::config

#endif  // FLYSCAN_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
