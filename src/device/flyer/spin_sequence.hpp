/*
 * spin_sequence.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: SpinSequence, the acquisition cycles driven by a spin flyer

**************************************************/

#ifndef FLYSCAN_DEVICE_FLYER_SPIN_SEQUENCE_HPP
#define FLYSCAN_DEVICE_FLYER_SPIN_SEQUENCE_HPP

#include <functional>
#include <string>

#include "acquisition_types.hpp"
#include "config/sections/flyer_config.hpp"
#include "device/template/actuator.hpp"
#include "device/template/capture_device.hpp"

namespace flyscan::device {

/**
 * @brief Motion and capture steps of a fly scan
 *
 * Holds non-owning references to the hardware. Every step blocks and throws
 * the hardware error unchanged, so it is meant to run on a background task.
 */
class SpinSequence {
public:
    using StateObserver = std::function<void(AcquisitionState)>;
    using RecordSink = std::function<void(AcquisitionRecord)>;

    SpinSequence(std::string ownerName, AtomActuator& actuator,
                 AtomCaptureDevice& capture, config::FlyerConfig config,
                 StateObserver observer);

    /**
     * @brief Move to the run-up position before the nominal start
     */
    void taxi();

    /**
     * @brief Arm capture, move to the finish position, disarm capture
     *
     * A failed move aborts the capture before the error propagates.
     */
    void fly();

    /**
     * @brief Move back to @p position
     */
    void returnTo(double position);

    /**
     * @brief Wait for the file write, then read the result descriptor
     */
    [[nodiscard]] auto acquireRecord(int seqNum) -> AcquisitionRecord;

    /**
     * @brief Run numCycles full cycles, then return to @p returnPosition
     *
     * Each record reaches @p sink before the next cycle starts.
     */
    void run(double returnPosition, const RecordSink& sink);

private:
    void enter(AcquisitionState state);

    std::string owner_;
    AtomActuator& actuator_;
    AtomCaptureDevice& capture_;
    config::FlyerConfig config_;
    StateObserver observer_;
};

}  // namespace flyscan::device

#endif  // FLYSCAN_DEVICE_FLYER_SPIN_SEQUENCE_HPP
