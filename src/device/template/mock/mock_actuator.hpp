/*
 * mock_actuator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: Mock Actuator Implementation for testing and simulation

*************************************************/

#pragma once

#include "../actuator.hpp"

#include <atomic>
#include <mutex>
#include <vector>

namespace flyscan::device {

class MockActuator : public AtomActuator {
public:
    explicit MockActuator(const std::string& name = "MockActuator",
                          double initialPosition = 0.0);
    ~MockActuator() override = default;

    // AtomActuator interface
    auto getPosition() const -> double override;
    void move(double position) override;
    auto isMoving() const -> bool override;

    auto describeConfiguration() const -> nlohmann::json override;
    auto readConfiguration() const -> nlohmann::json override;

    // Simulation controls
    // Units per second; zero or negative makes every move instantaneous.
    void setVelocity(double unitsPerSecond);
    auto getVelocity() const -> double;
    void setLimits(double minPosition, double maxPosition);
    void failNextMoves(int count);
    void setReadFault(bool enabled);

    auto getMoveHistory() const -> std::vector<double>;
    auto getMoveCount() const -> size_t;

private:
    static constexpr auto MOCK_UPDATE_PERIOD = std::chrono::milliseconds(2);

    mutable std::mutex mutex_;
    double position_;
    double velocity_{0.0};
    double min_limit_{-1.0e6};
    double max_limit_{1.0e6};
    std::atomic<bool> is_moving_{false};

    int pending_move_faults_{0};
    bool read_fault_{false};
    std::vector<double> move_history_;

    void simulateMovement(double target);
};

}  // namespace flyscan::device
