/*
 * spin_sequence.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "spin_sequence.hpp"

#include <chrono>
#include <exception>

#include <spdlog/spdlog.h>

#include "capture_choreography.hpp"

namespace flyscan::device {

namespace {

auto epochSeconds() -> double {
    return std::chrono::duration<double>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

SpinSequence::SpinSequence(std::string ownerName, AtomActuator& actuator,
                           AtomCaptureDevice& capture,
                           config::FlyerConfig config, StateObserver observer)
    : owner_(std::move(ownerName)),
      actuator_(actuator),
      capture_(capture),
      config_(std::move(config)),
      observer_(std::move(observer)) {}

void SpinSequence::enter(AcquisitionState state) {
    if (observer_) {
        observer_(state);
    }
}

void SpinSequence::taxi() {
    enter(AcquisitionState::Taxiing);
    const double target = config_.taxiPosition();
    spdlog::info("[SpinFlyer:{}] Taxi to {}", owner_, target);
    actuator_.move(target);
    enter(AcquisitionState::Idle);
}

void SpinSequence::fly() {
    enter(AcquisitionState::Flying);
    armCapture(capture_, config_.maxFrames);

    spdlog::info("[SpinFlyer:{}] Fly to {}", owner_, config_.finishPosition);
    try {
        actuator_.move(config_.finishPosition);
    } catch (const std::exception& e) {
        spdlog::error("[SpinFlyer:{}] Fly move failed: {}", owner_, e.what());
        abortCapture(capture_);
        throw;
    }

    disarmCapture(capture_);
    enter(AcquisitionState::Idle);
}

void SpinSequence::returnTo(double position) {
    enter(AcquisitionState::Returning);
    spdlog::info("[SpinFlyer:{}] Return to {}", owner_, position);
    actuator_.move(position);
    enter(AcquisitionState::Idle);
}

auto SpinSequence::acquireRecord(int seqNum) -> AcquisitionRecord {
    enter(AcquisitionState::Busy);
    waitForFileWrite(capture_, config_.fileWritePollInterval(),
                     std::chrono::milliseconds(config_.fileWriteTimeoutMs));

    AcquisitionRecord record;
    record.time = epochSeconds();
    record.seqNum = seqNum;
    for (const auto& [field, reading] : capture_.resultDescriptor()) {
        record.data[field] = reading.value;
        record.timestamps[field] = reading.timestamp;
    }
    enter(AcquisitionState::Idle);
    return record;
}

void SpinSequence::run(double returnPosition, const RecordSink& sink) {
    for (int cycle = 0; cycle < config_.numCycles; ++cycle) {
        spdlog::info("[SpinFlyer:{}] Cycle {}/{}", owner_, cycle + 1,
                     config_.numCycles);
        taxi();
        fly();
        sink(acquireRecord(cycle + 1));
    }
    returnTo(returnPosition);
}

}  // namespace flyscan::device
