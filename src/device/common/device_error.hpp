/*
 * device_error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Error codes shared by the device layer and the flyer

**************************************************/

#ifndef FLYSCAN_DEVICE_COMMON_DEVICE_ERROR_HPP
#define FLYSCAN_DEVICE_COMMON_DEVICE_ERROR_HPP

#include <optional>
#include <string>
#include <utility>

namespace flyscan::device {

/**
 * @brief Error category, grouped by hundreds
 */
enum class DeviceErrorCode {
    Unknown = 0,
    InvalidArgument = 10,  ///< Malformed request
    InvalidState = 11,     ///< Request does not fit the current state

    OperationFailed = 200,
    OperationTimeout = 201,
    OperationBusy = 203,  ///< Another operation is outstanding

    CommunicationError = 600,  ///< Hardware read or write failed

    ConfigurationError = 901
};

[[nodiscard]] inline auto deviceErrorCodeToString(DeviceErrorCode code)
    -> std::string {
    switch (code) {
        case DeviceErrorCode::InvalidArgument:
            return "InvalidArgument";
        case DeviceErrorCode::InvalidState:
            return "InvalidState";
        case DeviceErrorCode::OperationFailed:
            return "OperationFailed";
        case DeviceErrorCode::OperationTimeout:
            return "OperationTimeout";
        case DeviceErrorCode::OperationBusy:
            return "OperationBusy";
        case DeviceErrorCode::CommunicationError:
            return "CommunicationError";
        case DeviceErrorCode::ConfigurationError:
            return "ConfigurationError";
        case DeviceErrorCode::Unknown:
            break;
    }
    return "Unknown";
}

/**
 * @brief Error value carried by DeviceResult and by every DeviceException
 */
struct DeviceError {
    DeviceErrorCode code{DeviceErrorCode::Unknown};
    std::string message;
    std::optional<std::string> deviceName;
    std::optional<std::string> operationName;

    DeviceError() = default;

    explicit DeviceError(DeviceErrorCode errorCode, std::string text = "")
        : code(errorCode), message(std::move(text)) {}

    DeviceError(DeviceErrorCode errorCode, std::string text,
                std::string device)
        : code(errorCode),
          message(std::move(text)),
          deviceName(std::move(device)) {}

    /**
     * @brief "[Code] message (device: name) (operation: op)"
     */
    [[nodiscard]] auto toString() const -> std::string {
        auto text = "[" + deviceErrorCodeToString(code) + "] " + message;
        if (deviceName) {
            text += " (device: " + *deviceName + ")";
        }
        if (operationName) {
            text += " (operation: " + *operationName + ")";
        }
        return text;
    }
};

}  // namespace flyscan::device

#endif  // FLYSCAN_DEVICE_COMMON_DEVICE_ERROR_HPP
