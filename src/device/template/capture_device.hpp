/*
 * capture_device.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: AtomCaptureDevice, an area detector with a streaming file
plugin (HDF5 style capture into a single file)

*************************************************/

#pragma once

#include <map>
#include <string>

#include "device.hpp"

namespace flyscan::device {

enum class CaptureMode {
    Single,   // one frame per file
    Capture   // accumulate a stream of frames into one array
};

[[nodiscard]] inline auto captureModeToString(CaptureMode mode)
    -> std::string {
    return mode == CaptureMode::Capture ? "Capture" : "Single";
}

/**
 * @brief One readable field of the capture result.
 *
 * @c schema is the field descriptor (source, dtype, shape, units...). Its
 * content is opaque to the flyer and forwarded as-is.
 */
struct FieldReading {
    nlohmann::json value;
    double timestamp{0.0};
    nlohmann::json schema;
};

using ResultDescriptor = std::map<std::string, FieldReading>;

/**
 * @brief Capture device interface.
 *
 * Every command may throw HardwareCommunicationException. The arm and
 * disarm orders are a hardware contract and are not checked here.
 */
class AtomCaptureDevice : public AtomDriver {
public:
    explicit AtomCaptureDevice(std::string name)
        : AtomDriver(std::move(name)) {
        setType("CaptureDevice");
    }

    ~AtomCaptureDevice() override = default;

    // Array counter of the camera
    virtual void resetCounter() = 0;

    // Streaming file plugin
    virtual void enable() = 0;
    virtual void disable() = 0;
    virtual void setMode(CaptureMode mode) = 0;
    virtual void setMaxFrames(int frames) = 0;
    virtual void startCapture() = 0;
    virtual void stopCapture() = 0;
    virtual void writeFile() = 0;
    virtual auto isWriting() const -> bool = 0;

    /**
     * @brief Read the result fields (full file name and friends)
     */
    virtual auto resultDescriptor() const -> ResultDescriptor = 0;
};

}  // namespace flyscan::device
