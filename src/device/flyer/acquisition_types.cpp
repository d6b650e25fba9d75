/*
 * acquisition_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "acquisition_types.hpp"

#include <algorithm>
#include <cctype>

namespace flyscan::device {

auto acquisitionStateToString(AcquisitionState state) -> std::string {
    switch (state) {
        case AcquisitionState::Idle:
            return "Idle";
        case AcquisitionState::Taxiing:
            return "Taxiing";
        case AcquisitionState::Flying:
            return "Flying";
        case AcquisitionState::Returning:
            return "Returning";
        case AcquisitionState::Busy:
            return "Busy";
    }
    return "Unknown";
}

auto protocolPhaseToString(ProtocolPhase phase) -> std::string {
    switch (phase) {
        case ProtocolPhase::Idle:
            return "Idle";
        case ProtocolPhase::Running:
            return "Running";
        case ProtocolPhase::Completed:
            return "Completed";
    }
    return "Unknown";
}

auto flyerCommandToString(FlyerCommand command) -> std::string {
    switch (command) {
        case FlyerCommand::Taxi:
            return "taxi";
        case FlyerCommand::Fly:
            return "fly";
        case FlyerCommand::Return:
            return "return";
    }
    return "unknown";
}

auto parseFlyerCommand(std::string_view token) -> DeviceResult<FlyerCommand> {
    std::string lower(token);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "taxi") {
        return FlyerCommand::Taxi;
    }
    if (lower == "fly") {
        return FlyerCommand::Fly;
    }
    if (lower == "return") {
        return FlyerCommand::Return;
    }
    return failure<FlyerCommand>(
        DeviceErrorCode::InvalidArgument,
        "Unknown command '" + std::string(token) +
            "', expected one of: taxi, fly, return");
}

auto AcquisitionRecord::toJson() const -> nlohmann::json {
    return {{"time", time},
            {"seq_num", seqNum},
            {"data", data},
            {"timestamps", timestamps}};
}

}  // namespace flyscan::device
