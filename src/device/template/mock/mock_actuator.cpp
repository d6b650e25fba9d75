/*
 * mock_actuator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "mock_actuator.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include "device/common/device_exceptions.hpp"

namespace flyscan::device {

MockActuator::MockActuator(const std::string& name, double initialPosition)
    : AtomActuator(name), position_(initialPosition) {}

auto MockActuator::getPosition() const -> double {
    std::lock_guard lock(mutex_);
    if (read_fault_) {
        throw HardwareCommunicationException(name_,
                                             "Simulated position read fault");
    }
    return position_;
}

void MockActuator::move(double position) {
    {
        std::lock_guard lock(mutex_);
        if (pending_move_faults_ > 0) {
            --pending_move_faults_;
            setState(DeviceState::ALERT);
            throw HardwareCommunicationException(
                name_, "Simulated motion fault while moving to " +
                           std::to_string(position));
        }
        if (position < min_limit_ || position > max_limit_) {
            setState(DeviceState::ALERT);
            throw HardwareCommunicationException(
                name_, "Target " + std::to_string(position) +
                           " is outside the soft limits");
        }
        move_history_.push_back(position);
    }

    simulateMovement(position);
}

auto MockActuator::isMoving() const -> bool { return is_moving_; }

auto MockActuator::describeConfiguration() const -> nlohmann::json {
    auto description = AtomActuator::describeConfiguration();
    description[name_ + "_velocity"] = {{"source", "SIM:" + name_ + ".VELO"},
                                        {"dtype", "number"},
                                        {"shape", nlohmann::json::array()}};
    return description;
}

auto MockActuator::readConfiguration() const -> nlohmann::json {
    auto reading = AtomActuator::readConfiguration();
    reading[name_ + "_velocity"] = getVelocity();
    return reading;
}

void MockActuator::setVelocity(double unitsPerSecond) {
    std::lock_guard lock(mutex_);
    velocity_ = unitsPerSecond;
}

auto MockActuator::getVelocity() const -> double {
    std::lock_guard lock(mutex_);
    return velocity_;
}

void MockActuator::setLimits(double minPosition, double maxPosition) {
    std::lock_guard lock(mutex_);
    min_limit_ = std::min(minPosition, maxPosition);
    max_limit_ = std::max(minPosition, maxPosition);
}

void MockActuator::failNextMoves(int count) {
    std::lock_guard lock(mutex_);
    pending_move_faults_ = std::max(count, 0);
}

void MockActuator::setReadFault(bool enabled) {
    std::lock_guard lock(mutex_);
    read_fault_ = enabled;
}

auto MockActuator::getMoveHistory() const -> std::vector<double> {
    std::lock_guard lock(mutex_);
    return move_history_;
}

auto MockActuator::getMoveCount() const -> size_t {
    std::lock_guard lock(mutex_);
    return move_history_.size();
}

void MockActuator::simulateMovement(double target) {
    is_moving_ = true;
    setState(DeviceState::BUSY);

    double velocity = getVelocity();
    if (velocity > 0.0) {
        const double stepSize =
            velocity * std::chrono::duration<double>(MOCK_UPDATE_PERIOD).count();
        while (true) {
            std::this_thread::sleep_for(MOCK_UPDATE_PERIOD);
            double current;
            {
                std::lock_guard lock(mutex_);
                double remaining = target - position_;
                if (std::abs(remaining) <= stepSize) {
                    break;
                }
                position_ += remaining > 0 ? stepSize : -stepSize;
                current = position_;
            }
            notifyPositionChange(current);
        }
    }

    {
        std::lock_guard lock(mutex_);
        position_ = target;
    }
    notifyPositionChange(target);

    is_moving_ = false;
    setState(DeviceState::IDLE);
}

}  // namespace flyscan::device
