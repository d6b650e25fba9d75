/*
 * device_result.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: std::expected based results for non-throwing device helpers

**************************************************/

#ifndef FLYSCAN_DEVICE_COMMON_DEVICE_RESULT_HPP
#define FLYSCAN_DEVICE_COMMON_DEVICE_RESULT_HPP

#include <expected>
#include <string>
#include <utility>

#include "device_error.hpp"
#include "device_exceptions.hpp"

namespace flyscan::device {

template <typename T>
using DeviceResult = std::expected<T, DeviceError>;

template <typename T>
[[nodiscard]] inline auto failure(DeviceErrorCode code,
                                  const std::string& message)
    -> DeviceResult<T> {
    return std::unexpected(DeviceError(code, message));
}

/**
 * @brief Unwrap a result at an API boundary
 *
 * InvalidArgument, OperationBusy and CommunicationError map to their
 * dedicated exception types, every other code to DeviceException.
 */
template <typename T>
[[nodiscard]] auto valueOrThrow(DeviceResult<T>&& result) -> T {
    if (result) {
        return std::move(*result);
    }
    const auto& error = result.error();
    switch (error.code) {
        case DeviceErrorCode::InvalidArgument:
            throw DeviceValidationException(error.message);
        case DeviceErrorCode::OperationBusy:
            throw DeviceConcurrencyException(error.message);
        case DeviceErrorCode::CommunicationError:
            throw HardwareCommunicationException(error.message);
        default:
            throw DeviceException(error);
    }
}

}  // namespace flyscan::device

#endif  // FLYSCAN_DEVICE_COMMON_DEVICE_RESULT_HPP
