/*
 * test_completion_status.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: Tests for CompletionStatus

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "device/common/device_exceptions.hpp"
#include "device/flyer/completion_status.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace flyscan::device;
using namespace std::chrono_literals;

class CompletionStatusTest : public ::testing::Test {
protected:
    CompletionStatus status{"kickoff"};
};

// ========== Resolution Tests ==========

TEST_F(CompletionStatusTest, StartsUnresolved) {
    EXPECT_EQ(status.operation(), "kickoff");
    EXPECT_FALSE(status.done());
    EXPECT_FALSE(status.success().has_value());
    EXPECT_EQ(status.error(), nullptr);
    EXPECT_TRUE(status.errorMessage().empty());
}

TEST_F(CompletionStatusTest, SetFinished_Success) {
    status.setFinished();

    EXPECT_TRUE(status.done());
    ASSERT_TRUE(status.success().has_value());
    EXPECT_TRUE(*status.success());
    EXPECT_NO_THROW(status.rethrowIfFailed());
}

TEST_F(CompletionStatusTest, SetFailed_KeepsError) {
    status.setFailed(std::make_exception_ptr(
        HardwareCommunicationException("m1", "motion fault")));

    EXPECT_TRUE(status.done());
    EXPECT_FALSE(status.success().value());
    EXPECT_EQ(status.errorMessage(), "motion fault");
    EXPECT_THROW(status.rethrowIfFailed(), HardwareCommunicationException);
}

TEST_F(CompletionStatusTest, ResolveTwice_Throws) {
    status.setFinished();

    EXPECT_THROW(status.setFinished(), DeviceInvalidStateException);
    EXPECT_THROW(
        status.setFailed(std::make_exception_ptr(std::runtime_error("late"))),
        DeviceInvalidStateException);
    EXPECT_TRUE(status.success().value());
}

TEST_F(CompletionStatusTest, ResolveTwiceAfterFailure_KeepsFirstOutcome) {
    status.setFailed(std::make_exception_ptr(std::runtime_error("first")));

    EXPECT_THROW(status.setFinished(), DeviceInvalidStateException);
    EXPECT_FALSE(status.success().value());
    EXPECT_EQ(status.errorMessage(), "first");
}

// ========== Wait Tests ==========

TEST_F(CompletionStatusTest, WaitFor_TimesOutWhileUnresolved) {
    EXPECT_FALSE(status.waitFor(20ms));
}

TEST_F(CompletionStatusTest, Wait_ReturnsOnResolutionFromOtherThread) {
    std::thread resolver([this] {
        std::this_thread::sleep_for(20ms);
        status.setFinished();
    });

    status.wait();
    EXPECT_TRUE(status.done());
    resolver.join();
}

TEST_F(CompletionStatusTest, WaitFor_ReturnsTrueOnceResolved) {
    std::thread resolver([this] { status.setFinished(); });

    EXPECT_TRUE(status.waitFor(2s));
    resolver.join();
}

// ========== Callback Tests ==========

TEST_F(CompletionStatusTest, Callback_RunsOnResolution) {
    std::atomic<int> calls{0};
    status.addCallback([&calls](const CompletionStatus& resolved) {
        EXPECT_TRUE(resolved.done());
        ++calls;
    });
    EXPECT_EQ(calls, 0);

    status.setFinished();
    EXPECT_EQ(calls, 1);
}

TEST_F(CompletionStatusTest, Callback_RunsImmediatelyWhenAlreadyResolved) {
    status.setFailed(std::make_exception_ptr(std::runtime_error("boom")));

    bool observedFailure = false;
    status.addCallback([&observedFailure](const CompletionStatus& resolved) {
        observedFailure = !resolved.success().value();
    });
    EXPECT_TRUE(observedFailure);
}

TEST_F(CompletionStatusTest, ThrowingCallback_DoesNotBlockOthers) {
    int calls = 0;
    status.addCallback(
        [](const CompletionStatus&) { throw std::runtime_error("observer"); });
    status.addCallback([&calls](const CompletionStatus&) { ++calls; });

    EXPECT_NO_THROW(status.setFinished());
    EXPECT_EQ(calls, 1);
}

// ========== Elapsed Time Tests ==========

TEST_F(CompletionStatusTest, Elapsed_FrozenAfterResolution) {
    std::this_thread::sleep_for(15ms);
    status.setFinished();
    auto first = status.elapsed();
    std::this_thread::sleep_for(15ms);

    EXPECT_GE(first.count(), 15);
    EXPECT_EQ(status.elapsed(), first);
}
