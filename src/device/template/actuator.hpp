/*
 * actuator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: AtomActuator, a single positioning axis (rotary or linear stage)

*************************************************/

#pragma once

#include <functional>

#include "device.hpp"

namespace flyscan::device {

class AtomActuator : public AtomDriver {
public:
    explicit AtomActuator(std::string name) : AtomDriver(std::move(name)) {
        setType("Actuator");
    }

    ~AtomActuator() override = default;

    /**
     * @brief Current readback position in user units
     * @throws HardwareCommunicationException if the axis cannot be read
     */
    virtual auto getPosition() const -> double = 0;

    /**
     * @brief Absolute move that blocks until the motion is finished
     * @throws HardwareCommunicationException if the motion fails
     */
    virtual void move(double position) = 0;

    /**
     * @brief Moving/idle status of the axis
     */
    virtual auto isMoving() const -> bool = 0;

    using PositionCallback = std::function<void(double position)>;

    void setPositionCallback(PositionCallback callback) {
        position_callback_ = std::move(callback);
    }

protected:
    PositionCallback position_callback_;

    void notifyPositionChange(double position) {
        if (position_callback_) {
            position_callback_(position);
        }
    }
};

}  // namespace flyscan::device
