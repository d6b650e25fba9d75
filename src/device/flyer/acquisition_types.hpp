/*
 * acquisition_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: States, commands and records of the spin flyer

**************************************************/

#ifndef FLYSCAN_DEVICE_FLYER_ACQUISITION_TYPES_HPP
#define FLYSCAN_DEVICE_FLYER_ACQUISITION_TYPES_HPP

#include <map>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "device/common/device_result.hpp"

namespace flyscan::device {

/**
 * @brief What the flyer is doing with its hardware right now
 *
 * Busy means waiting on the capture device (file write).
 */
enum class AcquisitionState { Idle, Taxiing, Flying, Returning, Busy };

/**
 * @brief Phase of the kickoff / complete / collect protocol
 */
enum class ProtocolPhase { Idle, Running, Completed };

enum class FlyerCommand { Taxi, Fly, Return };

[[nodiscard]] auto acquisitionStateToString(AcquisitionState state)
    -> std::string;

[[nodiscard]] auto protocolPhaseToString(ProtocolPhase phase) -> std::string;

[[nodiscard]] auto flyerCommandToString(FlyerCommand command) -> std::string;

/**
 * @brief Parse a command token, case-insensitively
 * @return The command, or an InvalidArgument error for anything other than
 *         "taxi", "fly" or "return"
 */
[[nodiscard]] auto parseFlyerCommand(std::string_view token)
    -> DeviceResult<FlyerCommand>;

/**
 * @brief One event produced by a spin cycle
 */
struct AcquisitionRecord {
    double time{0.0};  ///< Seconds since the epoch
    int seqNum{0};     ///< 1-based within a run
    std::map<std::string, nlohmann::json> data;
    std::map<std::string, double> timestamps;

    /**
     * @brief {"time", "seq_num", "data", "timestamps"}
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

}  // namespace flyscan::device

#endif  // FLYSCAN_DEVICE_FLYER_ACQUISITION_TYPES_HPP
