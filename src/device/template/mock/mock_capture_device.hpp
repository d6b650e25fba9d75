/*
 * mock_capture_device.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: Mock capture device (camera + streaming file plugin) for
testing and simulation

*************************************************/

#pragma once

#include "../capture_device.hpp"

#include <chrono>
#include <mutex>
#include <set>
#include <vector>

namespace flyscan::device {

class MockCaptureDevice : public AtomCaptureDevice {
public:
    explicit MockCaptureDevice(const std::string& name = "simdet",
                               std::string fileDirectory = "/tmp/flyscan",
                               std::string filePrefix = "spin");
    ~MockCaptureDevice() override = default;

    // AtomCaptureDevice interface
    void resetCounter() override;
    void enable() override;
    void disable() override;
    void setMode(CaptureMode mode) override;
    void setMaxFrames(int frames) override;
    void startCapture() override;
    void stopCapture() override;
    void writeFile() override;
    auto isWriting() const -> bool override;
    auto resultDescriptor() const -> ResultDescriptor override;

    auto describeConfiguration() const -> nlohmann::json override;
    auto readConfiguration() const -> nlohmann::json override;

    // Simulation controls
    void setWriteDuration(std::chrono::milliseconds duration);
    void setFramePeriod(std::chrono::milliseconds period);
    // Every later call of the named command throws until clearFaults().
    void failOn(const std::string& command);
    void clearFaults();

    // Inspection
    auto getCommandLog() const -> std::vector<std::string>;
    void clearCommandLog();
    auto isEnabled() const -> bool;
    auto getMode() const -> CaptureMode;
    auto getMaxFrames() const -> int;
    auto isCapturing() const -> bool;
    auto getFileNumber() const -> int;
    auto getCapturedFrames() const -> int;
    auto getFullFileName() const -> std::string;

    static constexpr const char* CMD_RESET_COUNTER = "reset_counter";
    static constexpr const char* CMD_ENABLE = "enable";
    static constexpr const char* CMD_DISABLE = "disable";
    static constexpr const char* CMD_SET_MODE = "set_mode";
    static constexpr const char* CMD_SET_MAX_FRAMES = "set_max_frames";
    static constexpr const char* CMD_START_CAPTURE = "start_capture";
    static constexpr const char* CMD_STOP_CAPTURE = "stop_capture";
    static constexpr const char* CMD_WRITE_FILE = "write_file";

private:
    mutable std::mutex mutex_;

    std::string file_directory_;
    std::string file_prefix_;

    bool enabled_{false};
    CaptureMode mode_{CaptureMode::Single};
    int max_frames_{1};
    bool capturing_{false};
    int array_counter_{0};
    int captured_frames_{0};
    int file_number_{0};
    std::string full_file_name_;
    double file_timestamp_{0.0};

    std::chrono::steady_clock::time_point capture_start_;
    std::chrono::steady_clock::time_point write_deadline_;
    std::chrono::milliseconds write_duration_{20};
    std::chrono::milliseconds frame_period_{10};

    std::set<std::string> faults_;
    std::vector<std::string> command_log_;

    // Caller holds mutex_
    void recordCommand(const std::string& command,
                       const std::string& argument = "");
};

}  // namespace flyscan::device
