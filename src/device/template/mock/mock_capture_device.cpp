/*
 * mock_capture_device.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "mock_capture_device.hpp"

#include <algorithm>
#include <cstdio>

#include "device/common/device_exceptions.hpp"

namespace flyscan::device {

namespace {

auto epochSeconds() -> double {
    return std::chrono::duration<double>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

MockCaptureDevice::MockCaptureDevice(const std::string& name,
                                     std::string fileDirectory,
                                     std::string filePrefix)
    : AtomCaptureDevice(name),
      file_directory_(std::move(fileDirectory)),
      file_prefix_(std::move(filePrefix)) {}

void MockCaptureDevice::resetCounter() {
    std::lock_guard lock(mutex_);
    recordCommand(CMD_RESET_COUNTER);
    array_counter_ = 0;
}

void MockCaptureDevice::enable() {
    std::lock_guard lock(mutex_);
    recordCommand(CMD_ENABLE);
    enabled_ = true;
}

void MockCaptureDevice::disable() {
    std::lock_guard lock(mutex_);
    recordCommand(CMD_DISABLE);
    enabled_ = false;
}

void MockCaptureDevice::setMode(CaptureMode mode) {
    std::lock_guard lock(mutex_);
    recordCommand(CMD_SET_MODE, captureModeToString(mode));
    mode_ = mode;
}

void MockCaptureDevice::setMaxFrames(int frames) {
    std::lock_guard lock(mutex_);
    recordCommand(CMD_SET_MAX_FRAMES, std::to_string(frames));
    max_frames_ = frames;
}

void MockCaptureDevice::startCapture() {
    std::lock_guard lock(mutex_);
    recordCommand(CMD_START_CAPTURE);
    if (!enabled_) {
        throw HardwareCommunicationException(
            name_, "Capture requested while the file plugin is disabled");
    }
    capturing_ = true;
    captured_frames_ = 0;
    capture_start_ = std::chrono::steady_clock::now();
    setState(DeviceState::BUSY);
}

void MockCaptureDevice::stopCapture() {
    std::lock_guard lock(mutex_);
    recordCommand(CMD_STOP_CAPTURE);
    if (capturing_) {
        auto elapsed = std::chrono::steady_clock::now() - capture_start_;
        auto frames = static_cast<int>(elapsed / frame_period_);
        if (mode_ == CaptureMode::Single) {
            frames = std::min(frames, 1);
        }
        captured_frames_ = std::clamp(frames, 0, std::max(max_frames_, 0));
        array_counter_ += captured_frames_;
    }
    capturing_ = false;
    setState(DeviceState::IDLE);
}

void MockCaptureDevice::writeFile() {
    std::lock_guard lock(mutex_);
    recordCommand(CMD_WRITE_FILE);
    ++file_number_;

    char fileName[32];
    std::snprintf(fileName, sizeof(fileName), "_%06d.h5", file_number_);
    full_file_name_ = file_directory_ + "/" + file_prefix_ + fileName;
    file_timestamp_ = epochSeconds();
    write_deadline_ = std::chrono::steady_clock::now() + write_duration_;
}

auto MockCaptureDevice::isWriting() const -> bool {
    std::lock_guard lock(mutex_);
    if (faults_.contains("is_writing")) {
        throw HardwareCommunicationException(name_,
                                             "Simulated write status fault");
    }
    return std::chrono::steady_clock::now() < write_deadline_;
}

auto MockCaptureDevice::resultDescriptor() const -> ResultDescriptor {
    std::lock_guard lock(mutex_);
    if (faults_.contains("result_descriptor")) {
        throw HardwareCommunicationException(name_,
                                             "Simulated result read fault");
    }

    ResultDescriptor result;
    result[name_ + "_hdf1_full_file_name"] = FieldReading{
        full_file_name_, file_timestamp_,
        {{"source", "SIM:" + name_ + ":HDF1:FullFileName_RBV"},
         {"dtype", "string"},
         {"shape", nlohmann::json::array()}}};
    result[name_ + "_hdf1_num_captured"] = FieldReading{
        captured_frames_, file_timestamp_,
        {{"source", "SIM:" + name_ + ":HDF1:NumCaptured_RBV"},
         {"dtype", "integer"},
         {"shape", nlohmann::json::array()}}};
    return result;
}

auto MockCaptureDevice::describeConfiguration() const -> nlohmann::json {
    auto description = AtomCaptureDevice::describeConfiguration();
    description[name_ + "_hdf1_file_path"] = {
        {"source", "SIM:" + name_ + ":HDF1:FilePath"},
        {"dtype", "string"},
        {"shape", nlohmann::json::array()}};
    return description;
}

auto MockCaptureDevice::readConfiguration() const -> nlohmann::json {
    auto reading = AtomCaptureDevice::readConfiguration();
    std::lock_guard lock(mutex_);
    reading[name_ + "_hdf1_file_path"] = file_directory_;
    return reading;
}

void MockCaptureDevice::setWriteDuration(std::chrono::milliseconds duration) {
    std::lock_guard lock(mutex_);
    write_duration_ = duration;
}

void MockCaptureDevice::setFramePeriod(std::chrono::milliseconds period) {
    std::lock_guard lock(mutex_);
    frame_period_ = std::max(period, std::chrono::milliseconds(1));
}

void MockCaptureDevice::failOn(const std::string& command) {
    std::lock_guard lock(mutex_);
    faults_.insert(command);
}

void MockCaptureDevice::clearFaults() {
    std::lock_guard lock(mutex_);
    faults_.clear();
}

auto MockCaptureDevice::getCommandLog() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    return command_log_;
}

void MockCaptureDevice::clearCommandLog() {
    std::lock_guard lock(mutex_);
    command_log_.clear();
}

auto MockCaptureDevice::isEnabled() const -> bool {
    std::lock_guard lock(mutex_);
    return enabled_;
}

auto MockCaptureDevice::getMode() const -> CaptureMode {
    std::lock_guard lock(mutex_);
    return mode_;
}

auto MockCaptureDevice::getMaxFrames() const -> int {
    std::lock_guard lock(mutex_);
    return max_frames_;
}

auto MockCaptureDevice::isCapturing() const -> bool {
    std::lock_guard lock(mutex_);
    return capturing_;
}

auto MockCaptureDevice::getFileNumber() const -> int {
    std::lock_guard lock(mutex_);
    return file_number_;
}

auto MockCaptureDevice::getCapturedFrames() const -> int {
    std::lock_guard lock(mutex_);
    return captured_frames_;
}

auto MockCaptureDevice::getFullFileName() const -> std::string {
    std::lock_guard lock(mutex_);
    return full_file_name_;
}

void MockCaptureDevice::recordCommand(const std::string& command,
                                      const std::string& argument) {
    if (faults_.contains(command)) {
        setState(DeviceState::ALERT);
        throw HardwareCommunicationException(
            name_, "Simulated fault on command '" + command + "'");
    }
    command_log_.push_back(argument.empty() ? command
                                            : command + ":" + argument);
}

}  // namespace flyscan::device
