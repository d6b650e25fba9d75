/*
 * configurable.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Validation result types shared by configuration sections

**************************************************/

#ifndef FLYSCAN_CONFIG_CORE_CONFIGURABLE_HPP
#define FLYSCAN_CONFIG_CORE_CONFIGURABLE_HPP

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace flyscan::config {

using json = nlohmann::json;

/**
 * @brief Configuration validation result
 */
struct ConfigValidationError {
    std::string path;     ///< Path to the invalid value
    std::string message;  ///< Error description
    std::string keyword;  ///< JSON Schema keyword that failed (optional)
};

/**
 * @brief Result of configuration validation
 */
struct ConfigValidationResult {
    bool valid{true};                           ///< Whether validation passed
    std::vector<ConfigValidationError> errors;  ///< List of validation errors

    [[nodiscard]] bool isValid() const noexcept { return valid; }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }

    void addError(std::string path, std::string message,
                  std::string keyword = "") {
        valid = false;
        errors.push_back(
            {std::move(path), std::move(message), std::move(keyword)});
    }

    /**
     * @brief All errors joined as "path: message" lines
     */
    [[nodiscard]] std::string summary() const {
        std::string text;
        for (const auto& error : errors) {
            if (!text.empty()) {
                text += "\n";
            }
            text += error.path + ": " + error.message;
        }
        return text;
    }
};

}  // namespace flyscan::config

#endif  // FLYSCAN_CONFIG_CORE_CONFIGURABLE_HPP
