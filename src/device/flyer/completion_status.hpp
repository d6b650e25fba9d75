/*
 * completion_status.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: CompletionStatus, the handle returned by asynchronous flyer
operations

**************************************************/

#ifndef FLYSCAN_DEVICE_FLYER_COMPLETION_STATUS_HPP
#define FLYSCAN_DEVICE_FLYER_COMPLETION_STATUS_HPP

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flyscan::device {

/**
 * @brief Outcome of one asynchronous operation
 *
 * Starts unresolved and is resolved exactly once, either finished or failed
 * with the exception that ended the operation. Shared between the flyer and
 * the caller through std::shared_ptr.
 */
class CompletionStatus {
public:
    using Callback = std::function<void(const CompletionStatus&)>;

    explicit CompletionStatus(std::string operation);

    CompletionStatus(const CompletionStatus&) = delete;
    CompletionStatus& operator=(const CompletionStatus&) = delete;

    [[nodiscard]] auto operation() const -> const std::string&;

    [[nodiscard]] auto done() const -> bool;

    /**
     * @brief nullopt while unresolved, then true or false
     */
    [[nodiscard]] auto success() const -> std::optional<bool>;

    /**
     * @brief Resolve with success
     * @throws DeviceInvalidStateException if already resolved
     */
    void setFinished();

    /**
     * @brief Resolve with failure
     * @throws DeviceInvalidStateException if already resolved
     */
    void setFailed(std::exception_ptr error);

    /**
     * @brief Block until resolved
     */
    void wait() const;

    /**
     * @return true if resolved within the timeout
     */
    [[nodiscard]] auto waitFor(std::chrono::milliseconds timeout) const
        -> bool;

    [[nodiscard]] auto error() const -> std::exception_ptr;

    /**
     * @brief what() of the stored failure, empty when none
     *
     * Failures that are not std::exception are rethrown.
     */
    [[nodiscard]] auto errorMessage() const -> std::string;

    /**
     * @brief Rethrow the stored failure, no-op otherwise
     */
    void rethrowIfFailed() const;

    /**
     * @brief Run @p callback once resolved, immediately if already resolved
     */
    void addCallback(Callback callback);

    /**
     * @brief Time from creation to resolution, or to now while unresolved
     */
    [[nodiscard]] auto elapsed() const -> std::chrono::milliseconds;

private:
    void resolve(bool success, std::exception_ptr error);

    std::string operation_;
    std::chrono::steady_clock::time_point created_;
    std::chrono::steady_clock::time_point resolved_at_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool done_{false};
    bool success_{false};
    std::exception_ptr error_;
    std::vector<Callback> callbacks_;
};

using CompletionStatusPtr = std::shared_ptr<CompletionStatus>;

}  // namespace flyscan::device

#endif  // FLYSCAN_DEVICE_FLYER_COMPLETION_STATUS_HPP
