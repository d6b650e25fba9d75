/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: CRTP base shared by the flyer, simulation and logging sections

**************************************************/

#ifndef FLYSCAN_CONFIG_CORE_CONFIG_SECTION_HPP
#define FLYSCAN_CONFIG_CORE_CONFIG_SECTION_HPP

#include <optional>
#include <string>
#include <string_view>

#include "configurable.hpp"

namespace flyscan::config {

/**
 * @brief Base of a typed configuration section
 *
 * Derived provides `PATH`, `serialize()`, `static deserialize(const json&)`
 * and `static generateSchema()`. An optional
 * `validateFields(ConfigValidationResult&) const` adds range checks; the
 * errors it reports use PATH as the prefix of their paths.
 *
 * deserialize() keeps the default of every key that is absent and throws
 * nlohmann::json::exception on a key of the wrong type.
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] json toJson() const {
        return static_cast<const Derived&>(*this).serialize();
    }

    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        const auto& self = static_cast<const Derived&>(*this);
        if constexpr (requires { self.validateFields(result); }) {
            self.validateFields(result);
        }
        return result;
    }

    /// Sections compare equal when they serialize equally
    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == other.toJson();
    }

protected:
    template <typename T>
    static void addSchemaProperty(json& schema, const std::string& name,
                                  const std::string& type, const T& fallback,
                                  const std::string& description = "") {
        json& property = schema["properties"][name];
        property["type"] = type;
        property["default"] = fallback;
        if (!description.empty()) {
            property["description"] = description;
        }
    }

    /// No-op for a property that was not added first
    static void addRange(json& schema, const std::string& name,
                         std::optional<double> minimum = std::nullopt,
                         std::optional<double> maximum = std::nullopt) {
        if (!schema.contains("properties") ||
            !schema["properties"].contains(name)) {
            return;
        }
        auto& property = schema["properties"][name];
        if (minimum) {
            property["minimum"] = *minimum;
        }
        if (maximum) {
            property["maximum"] = *maximum;
        }
    }
};

}  // namespace flyscan::config

#endif  // FLYSCAN_CONFIG_CORE_CONFIG_SECTION_HPP
