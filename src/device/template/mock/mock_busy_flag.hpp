/*
 * mock_busy_flag.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: Mock busy record for testing and simulation

*************************************************/

#pragma once

#include "../busy_flag.hpp"

#include <chrono>
#include <mutex>
#include <vector>

namespace flyscan::device {

class MockBusyFlag : public AtomBusyFlag {
public:
    explicit MockBusyFlag(const std::string& name = "mybusy");
    ~MockBusyFlag() override = default;

    auto get() const -> bool override;
    void set(bool busy) override;

    // Simulation controls
    void failOnSet(bool enabled);
    void failOnGet(bool enabled);
    // Delay applied to every set(), outside the record's lock
    void setWriteLatency(std::chrono::milliseconds latency);

    // Every value written through set(), in order
    auto getWriteHistory() const -> std::vector<bool>;

private:
    mutable std::mutex mutex_;
    bool value_{false};
    bool fail_on_set_{false};
    bool fail_on_get_{false};
    std::chrono::milliseconds write_latency_{0};
    std::vector<bool> write_history_;
};

}  // namespace flyscan::device
