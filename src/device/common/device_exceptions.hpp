/*
 * device_exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Exceptions thrown by the device layer and the flyer

**************************************************/

#ifndef FLYSCAN_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP
#define FLYSCAN_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "device_error.hpp"

namespace flyscan::device {

/**
 * @brief Root of the hierarchy, what() is the bare message
 */
class DeviceException : public std::runtime_error {
public:
    explicit DeviceException(const std::string& message,
                             DeviceErrorCode code = DeviceErrorCode::Unknown)
        : std::runtime_error(message), error_(code, message) {}

    DeviceException(const std::string& message, const std::string& deviceName,
                    DeviceErrorCode code = DeviceErrorCode::Unknown)
        : std::runtime_error(message), error_(code, message, deviceName) {}

    explicit DeviceException(const DeviceError& error)
        : std::runtime_error(error.message), error_(error) {}

    [[nodiscard]] auto error() const noexcept -> const DeviceError& {
        return error_;
    }
    [[nodiscard]] auto code() const noexcept -> DeviceErrorCode {
        return error_.code;
    }
    [[nodiscard]] auto deviceName() const -> std::optional<std::string> {
        return error_.deviceName;
    }
    [[nodiscard]] auto operationName() const -> std::optional<std::string> {
        return error_.operationName;
    }

protected:
    DeviceError error_;
};

/**
 * @brief Unknown command token or a configuration that does not validate
 */
class DeviceValidationException : public DeviceException {
public:
    explicit DeviceValidationException(const std::string& message)
        : DeviceException(message, DeviceErrorCode::InvalidArgument) {}

    DeviceValidationException(
        const std::string& message, const std::string& deviceName,
        DeviceErrorCode code = DeviceErrorCode::InvalidArgument)
        : DeviceException(message, deviceName, code) {}
};

/**
 * @brief Protocol sequencing violation
 *
 * The request came while another operation was outstanding, or before the
 * operation it depends on. Nothing was changed.
 */
class DeviceConcurrencyException : public DeviceException {
public:
    explicit DeviceConcurrencyException(const std::string& message)
        : DeviceException(message, DeviceErrorCode::OperationBusy) {}

    DeviceConcurrencyException(const std::string& message,
                               const std::string& deviceName)
        : DeviceException(message, deviceName, DeviceErrorCode::OperationBusy) {
    }
};

/**
 * @brief A named operation of a device failed
 */
class DeviceOperationException : public DeviceException {
public:
    DeviceOperationException(
        const std::string& message, const std::string& deviceName,
        const std::string& operationName,
        DeviceErrorCode code = DeviceErrorCode::OperationFailed)
        : DeviceException(message, deviceName, code) {
        error_.operationName = operationName;
    }
};

class DeviceTimeoutException : public DeviceOperationException {
public:
    DeviceTimeoutException(const std::string& deviceName,
                           const std::string& operationName, int timeoutMs)
        : DeviceOperationException("Operation '" + operationName +
                                       "' timeout after " +
                                       std::to_string(timeoutMs) + "ms",
                                   deviceName, operationName,
                                   DeviceErrorCode::OperationTimeout),
          timeoutMs_(timeoutMs) {}

    [[nodiscard]] auto timeoutMs() const noexcept -> int { return timeoutMs_; }

private:
    int timeoutMs_;
};

/**
 * @brief An object was asked for a transition its state does not allow
 */
class DeviceInvalidStateException : public DeviceException {
public:
    DeviceInvalidStateException(const std::string& subject,
                                const std::string& expected,
                                const std::string& actual)
        : DeviceException(subject + " is " + actual + ", expected " + expected,
                          DeviceErrorCode::InvalidState) {}
};

/**
 * @brief Read or write on the hardware failed
 */
class HardwareCommunicationException : public DeviceException {
public:
    explicit HardwareCommunicationException(const std::string& message)
        : DeviceException(message, DeviceErrorCode::CommunicationError) {}

    HardwareCommunicationException(const std::string& deviceName,
                                   const std::string& message)
        : DeviceException(message, deviceName,
                          DeviceErrorCode::CommunicationError) {}
};

}  // namespace flyscan::device

#endif  // FLYSCAN_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP
