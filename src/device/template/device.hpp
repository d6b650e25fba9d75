/*
 * device.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: Base definition shared by the fly-scan device templates

*************************************************/

#ifndef FLYSCAN_DEVICE_TEMPLATE_DEVICE_HPP
#define FLYSCAN_DEVICE_TEMPLATE_DEVICE_HPP

#include <chrono>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace flyscan::device {

// Device states following INDI convention
enum class DeviceState {
    IDLE = 0,
    BUSY,
    ALERT,
    ERROR,
    UNKNOWN
};

[[nodiscard]] inline auto deviceStateToString(DeviceState state)
    -> std::string {
    switch (state) {
        case DeviceState::IDLE:
            return "IDLE";
        case DeviceState::BUSY:
            return "BUSY";
        case DeviceState::ALERT:
            return "ALERT";
        case DeviceState::ERROR:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Common base of every hardware handle a flyer can drive.
 *
 * Handles never reference the controller that drives them.
 */
class AtomDriver {
public:
    explicit AtomDriver(std::string name)
        : name_(std::move(name)), state_(DeviceState::IDLE) {}

    virtual ~AtomDriver() = default;

    AtomDriver(const AtomDriver&) = delete;
    AtomDriver& operator=(const AtomDriver&) = delete;

    const std::string& getName() const { return name_; }
    const std::string& getType() const { return type_; }
    void setType(const std::string& type) { type_ = type; }

    DeviceState getState() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }
    void setState(DeviceState state) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = state;
        last_update_ = std::chrono::system_clock::now();
    }

    std::chrono::system_clock::time_point getLastUpdate() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return last_update_;
    }

    /**
     * @brief Describe the configuration values this device exposes
     * @return JSON object keyed by "<name>_<parameter>"
     */
    virtual auto describeConfiguration() const -> nlohmann::json {
        return {{name_ + "_type", {{"source", "SIM:" + name_},
                                   {"dtype", "string"},
                                   {"shape", nlohmann::json::array()}}}};
    }

    /**
     * @brief Current values of the configuration described above
     */
    virtual auto readConfiguration() const -> nlohmann::json {
        return {{name_ + "_type", type_}};
    }

protected:
    std::string name_;
    std::string type_;
    DeviceState state_;
    std::chrono::system_clock::time_point last_update_{
        std::chrono::system_clock::now()};
    mutable std::mutex state_mutex_;
};

}  // namespace flyscan::device

#endif  // FLYSCAN_DEVICE_TEMPLATE_DEVICE_HPP
