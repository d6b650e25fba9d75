/*
 * capture_choreography.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: Ordered arm / disarm sequences of a streaming capture device

**************************************************/

#ifndef FLYSCAN_DEVICE_FLYER_CAPTURE_CHOREOGRAPHY_HPP
#define FLYSCAN_DEVICE_FLYER_CAPTURE_CHOREOGRAPHY_HPP

#include <chrono>

#include "device/template/capture_device.hpp"

namespace flyscan::device {

/**
 * @brief Prepare the file plugin and start streaming
 *
 * reset counter, enable plugin, mode Capture, max frames, start capture.
 * The order is part of the hardware contract.
 */
void armCapture(AtomCaptureDevice& device, int maxFrames);

/**
 * @brief Stop streaming, write the file and restore single-frame defaults
 *
 * stop capture, write file, mode Single, max frames 1, disable plugin.
 */
void disarmCapture(AtomCaptureDevice& device);

/**
 * @brief Best-effort disarm without a file write, used after a failed fly
 *
 * Every step is attempted. Step failures are logged, never thrown.
 */
void abortCapture(AtomCaptureDevice& device) noexcept;

/**
 * @brief Poll isWriting() until it reports false
 * @throws DeviceTimeoutException if the write outlasts @p timeout
 */
void waitForFileWrite(const AtomCaptureDevice& device,
                      std::chrono::milliseconds pollInterval,
                      std::chrono::milliseconds timeout);

}  // namespace flyscan::device

#endif  // FLYSCAN_DEVICE_FLYER_CAPTURE_CHOREOGRAPHY_HPP
