/*
 * mock_busy_flag.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "mock_busy_flag.hpp"

#include <thread>

#include "device/common/device_exceptions.hpp"

namespace flyscan::device {

MockBusyFlag::MockBusyFlag(const std::string& name) : AtomBusyFlag(name) {}

auto MockBusyFlag::get() const -> bool {
    std::lock_guard lock(mutex_);
    if (fail_on_get_) {
        throw HardwareCommunicationException(name_,
                                             "Simulated busy record read fault");
    }
    return value_;
}

void MockBusyFlag::set(bool busy) {
    std::chrono::milliseconds latency;
    {
        std::lock_guard lock(mutex_);
        latency = write_latency_;
    }
    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }

    std::lock_guard lock(mutex_);
    if (fail_on_set_) {
        throw HardwareCommunicationException(
            name_, "Simulated busy record write fault");
    }
    value_ = busy;
    write_history_.push_back(busy);
    setState(busy ? DeviceState::BUSY : DeviceState::IDLE);
}

void MockBusyFlag::failOnSet(bool enabled) {
    std::lock_guard lock(mutex_);
    fail_on_set_ = enabled;
}

void MockBusyFlag::failOnGet(bool enabled) {
    std::lock_guard lock(mutex_);
    fail_on_get_ = enabled;
}

void MockBusyFlag::setWriteLatency(std::chrono::milliseconds latency) {
    std::lock_guard lock(mutex_);
    write_latency_ = latency;
}

auto MockBusyFlag::getWriteHistory() const -> std::vector<bool> {
    std::lock_guard lock(mutex_);
    return write_history_;
}

}  // namespace flyscan::device
