/*
 * capture_choreography.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "capture_choreography.hpp"

#include <exception>
#include <thread>

#include <spdlog/spdlog.h>

#include "device/common/device_exceptions.hpp"

namespace flyscan::device {

void armCapture(AtomCaptureDevice& device, int maxFrames) {
    spdlog::debug("[Capture:{}] Arming, max frames {}", device.getName(),
                  maxFrames);
    device.resetCounter();
    device.enable();
    device.setMode(CaptureMode::Capture);
    device.setMaxFrames(maxFrames);
    device.startCapture();
}

void disarmCapture(AtomCaptureDevice& device) {
    spdlog::debug("[Capture:{}] Disarming", device.getName());
    device.stopCapture();
    device.writeFile();
    device.setMode(CaptureMode::Single);
    device.setMaxFrames(1);
    device.disable();
}

void abortCapture(AtomCaptureDevice& device) noexcept {
    static constexpr const char* kAbortSteps[] = {
        "stop capture", "reset mode", "reset max frames", "disable plugin"};

    spdlog::warn("[Capture:{}] Aborting capture", device.getName());
    for (int step = 0; step < 4; ++step) {
        try {
            switch (step) {
                case 0:
                    device.stopCapture();
                    break;
                case 1:
                    device.setMode(CaptureMode::Single);
                    break;
                case 2:
                    device.setMaxFrames(1);
                    break;
                default:
                    device.disable();
                    break;
            }
        } catch (const std::exception& e) {
            spdlog::error("[Capture:{}] Abort step '{}' failed: {}",
                          device.getName(), kAbortSteps[step], e.what());
        }
    }
}

void waitForFileWrite(const AtomCaptureDevice& device,
                      std::chrono::milliseconds pollInterval,
                      std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (device.isWriting()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw DeviceTimeoutException(device.getName(), "write_file",
                                         static_cast<int>(timeout.count()));
        }
        std::this_thread::sleep_for(pollInterval);
    }
}

}  // namespace flyscan::device
