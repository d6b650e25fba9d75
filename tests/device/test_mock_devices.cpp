/*
 * test_mock_devices.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: Tests for the simulated actuator, capture device and busy
record, and for BusyGuard

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "device/common/device_exceptions.hpp"
#include "device/flyer/busy_guard.hpp"
#include "device/template/mock/mock_actuator.hpp"
#include "device/template/mock/mock_busy_flag.hpp"
#include "device/template/mock/mock_capture_device.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace flyscan::device;
using namespace std::chrono_literals;
using ::testing::ElementsAre;

// ========== MockActuator Tests ==========

class MockActuatorTest : public ::testing::Test {
protected:
    MockActuator actuator{"m1", 1.5};
};

TEST_F(MockActuatorTest, InitialState) {
    EXPECT_EQ(actuator.getName(), "m1");
    EXPECT_EQ(actuator.getType(), "Actuator");
    EXPECT_DOUBLE_EQ(actuator.getPosition(), 1.5);
    EXPECT_FALSE(actuator.isMoving());
    EXPECT_EQ(actuator.getState(), DeviceState::IDLE);
}

TEST_F(MockActuatorTest, Move_Instantaneous) {
    actuator.move(-4.0);
    EXPECT_DOUBLE_EQ(actuator.getPosition(), -4.0);
    EXPECT_FALSE(actuator.isMoving());
    EXPECT_THAT(actuator.getMoveHistory(), ElementsAre(-4.0));
}

TEST_F(MockActuatorTest, Move_WithVelocity_ReportsMoving) {
    actuator.setVelocity(50.0);
    std::thread mover([this] { actuator.move(11.5); });

    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(actuator.isMoving());
    EXPECT_EQ(actuator.getState(), DeviceState::BUSY);

    mover.join();
    EXPECT_FALSE(actuator.isMoving());
    EXPECT_DOUBLE_EQ(actuator.getPosition(), 11.5);
}

TEST_F(MockActuatorTest, PositionCallback_ReportsTarget) {
    std::vector<double> positions;
    actuator.setPositionCallback(
        [&positions](double position) { positions.push_back(position); });

    actuator.move(2.0);
    ASSERT_FALSE(positions.empty());
    EXPECT_DOUBLE_EQ(positions.back(), 2.0);
}

TEST_F(MockActuatorTest, FailNextMoves_ThrowsThenRecovers) {
    actuator.failNextMoves(2);

    EXPECT_THROW(actuator.move(5.0), HardwareCommunicationException);
    EXPECT_THROW(actuator.move(5.0), HardwareCommunicationException);
    EXPECT_EQ(actuator.getState(), DeviceState::ALERT);
    EXPECT_NO_THROW(actuator.move(5.0));
    EXPECT_DOUBLE_EQ(actuator.getPosition(), 5.0);
    EXPECT_EQ(actuator.getMoveCount(), 1u);
}

TEST_F(MockActuatorTest, Move_OutsideLimits_Throws) {
    actuator.setLimits(10.0, -10.0);

    EXPECT_THROW(actuator.move(20.0), HardwareCommunicationException);
    EXPECT_DOUBLE_EQ(actuator.getPosition(), 1.5);
    EXPECT_NO_THROW(actuator.move(-10.0));
}

TEST_F(MockActuatorTest, ReadFault_Throws) {
    actuator.setReadFault(true);
    EXPECT_THROW((void)actuator.getPosition(), HardwareCommunicationException);
}

TEST_F(MockActuatorTest, Configuration_IncludesVelocity) {
    actuator.setVelocity(2.5);
    auto reading = actuator.readConfiguration();
    EXPECT_EQ(reading["m1_type"], "Actuator");
    EXPECT_DOUBLE_EQ(reading["m1_velocity"].get<double>(), 2.5);
    EXPECT_TRUE(actuator.describeConfiguration().contains("m1_velocity"));
}

// ========== MockCaptureDevice Tests ==========

class MockCaptureDeviceTest : public ::testing::Test {
protected:
    MockCaptureDevice device{"simdet", "/data", "scan"};
};

TEST_F(MockCaptureDeviceTest, StartCapture_RequiresEnabledPlugin) {
    EXPECT_THROW(device.startCapture(), HardwareCommunicationException);
    EXPECT_FALSE(device.isCapturing());

    device.enable();
    EXPECT_NO_THROW(device.startCapture());
    EXPECT_TRUE(device.isCapturing());
}

TEST_F(MockCaptureDeviceTest, StopCapture_CountsFramesUpToMax) {
    device.setFramePeriod(1ms);
    device.enable();
    device.setMode(CaptureMode::Capture);
    device.setMaxFrames(3);
    device.startCapture();
    std::this_thread::sleep_for(20ms);
    device.stopCapture();

    EXPECT_EQ(device.getCapturedFrames(), 3);
}

TEST_F(MockCaptureDeviceTest, WriteFile_NamesFileAndReportsWriting) {
    device.setWriteDuration(50ms);
    device.writeFile();

    EXPECT_EQ(device.getFileNumber(), 1);
    EXPECT_EQ(device.getFullFileName(), "/data/scan_000001.h5");
    EXPECT_TRUE(device.isWriting());

    std::this_thread::sleep_for(80ms);
    EXPECT_FALSE(device.isWriting());

    device.writeFile();
    EXPECT_EQ(device.getFullFileName(), "/data/scan_000002.h5");
}

TEST_F(MockCaptureDeviceTest, ResultDescriptor_CarriesSchema) {
    device.writeFile();
    auto result = device.resultDescriptor();

    ASSERT_TRUE(result.contains("simdet_hdf1_full_file_name"));
    const auto& file = result.at("simdet_hdf1_full_file_name");
    EXPECT_EQ(file.value, "/data/scan_000001.h5");
    EXPECT_GT(file.timestamp, 0.0);
    EXPECT_EQ(file.schema["dtype"], "string");
    EXPECT_TRUE(result.contains("simdet_hdf1_num_captured"));
}

TEST_F(MockCaptureDeviceTest, FailOn_PersistsUntilCleared) {
    device.failOn(MockCaptureDevice::CMD_ENABLE);
    device.failOn("is_writing");

    EXPECT_THROW(device.enable(), HardwareCommunicationException);
    EXPECT_THROW(device.enable(), HardwareCommunicationException);
    EXPECT_THROW((void)device.isWriting(), HardwareCommunicationException);

    device.clearFaults();
    EXPECT_NO_THROW(device.enable());
    EXPECT_THAT(device.getCommandLog(), ElementsAre("enable"));
}

TEST_F(MockCaptureDeviceTest, CommandLog_RecordsArguments) {
    device.setMode(CaptureMode::Capture);
    device.setMaxFrames(42);
    EXPECT_THAT(device.getCommandLog(),
                ElementsAre("set_mode:Capture", "set_max_frames:42"));

    device.clearCommandLog();
    EXPECT_TRUE(device.getCommandLog().empty());
}

// ========== MockBusyFlag Tests ==========

TEST(MockBusyFlagTest, SetAndGet) {
    MockBusyFlag busy;
    EXPECT_EQ(busy.getName(), "mybusy");
    EXPECT_FALSE(busy.get());

    busy.set(true);
    EXPECT_TRUE(busy.get());
    EXPECT_EQ(busy.getState(), DeviceState::BUSY);

    busy.set(false);
    EXPECT_THAT(busy.getWriteHistory(), ElementsAre(true, false));
}

TEST(MockBusyFlagTest, Faults) {
    MockBusyFlag busy;
    busy.failOnSet(true);
    EXPECT_THROW(busy.set(true), HardwareCommunicationException);
    EXPECT_TRUE(busy.getWriteHistory().empty());

    busy.failOnGet(true);
    EXPECT_THROW((void)busy.get(), HardwareCommunicationException);
}

// ========== BusyGuard Tests ==========

TEST(BusyGuardTest, SetsAndClearsOnScopeExit) {
    MockBusyFlag busy;
    {
        BusyGuard guard(busy);
        EXPECT_TRUE(guard.held());
        EXPECT_TRUE(busy.get());
    }
    EXPECT_FALSE(busy.get());
    EXPECT_THAT(busy.getWriteHistory(), ElementsAre(true, false));
}

TEST(BusyGuardTest, ClearsWhenScopeThrows) {
    MockBusyFlag busy;
    try {
        BusyGuard guard(busy);
        throw std::runtime_error("step failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(busy.get());
}

TEST(BusyGuardTest, ReleaseIsIdempotent) {
    MockBusyFlag busy;
    BusyGuard guard(busy);

    guard.release();
    guard.release();
    EXPECT_FALSE(guard.held());
    EXPECT_THAT(busy.getWriteHistory(), ElementsAre(true, false));
}

TEST(BusyGuardTest, MoveTransfersOwnership) {
    MockBusyFlag busy;
    BusyGuard first(busy);
    BusyGuard second(std::move(first));

    EXPECT_FALSE(first.held());
    EXPECT_TRUE(second.held());
    second.release();
    EXPECT_THAT(busy.getWriteHistory(), ElementsAre(true, false));
}

TEST(BusyGuardTest, ReleaseFailure_Throws) {
    MockBusyFlag busy;
    BusyGuard guard(busy);
    busy.failOnSet(true);

    EXPECT_THROW(guard.release(), HardwareCommunicationException);
    EXPECT_FALSE(guard.held());
    EXPECT_TRUE(busy.get());
}

TEST(BusyGuardTest, AcquireFailure_Throws) {
    MockBusyFlag busy;
    busy.failOnSet(true);
    EXPECT_THROW(BusyGuard guard(busy), HardwareCommunicationException);
}
