/*
 * completion_status.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "completion_status.hpp"

#include <spdlog/spdlog.h>

#include "device/common/device_exceptions.hpp"

namespace flyscan::device {

CompletionStatus::CompletionStatus(std::string operation)
    : operation_(std::move(operation)),
      created_(std::chrono::steady_clock::now()) {}

auto CompletionStatus::operation() const -> const std::string& {
    return operation_;
}

auto CompletionStatus::done() const -> bool {
    std::lock_guard lock(mutex_);
    return done_;
}

auto CompletionStatus::success() const -> std::optional<bool> {
    std::lock_guard lock(mutex_);
    if (!done_) {
        return std::nullopt;
    }
    return success_;
}

void CompletionStatus::setFinished() { resolve(true, nullptr); }

void CompletionStatus::setFailed(std::exception_ptr error) {
    resolve(false, std::move(error));
}

void CompletionStatus::resolve(bool success, std::exception_ptr error) {
    std::vector<Callback> callbacks;
    {
        std::lock_guard lock(mutex_);
        if (done_) {
            throw DeviceInvalidStateException(
                operation_, "unresolved",
                success_ ? "finished" : "failed");
        }
        done_ = true;
        success_ = success;
        error_ = std::move(error);
        resolved_at_ = std::chrono::steady_clock::now();
        callbacks.swap(callbacks_);
    }
    cv_.notify_all();

    for (auto& callback : callbacks) {
        try {
            callback(*this);
        } catch (const std::exception& e) {
            spdlog::error("Completion callback of '{}' threw: {}", operation_,
                          e.what());
        }
    }
}

void CompletionStatus::wait() const {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return done_; });
}

auto CompletionStatus::waitFor(std::chrono::milliseconds timeout) const
    -> bool {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return done_; });
}

auto CompletionStatus::error() const -> std::exception_ptr {
    std::lock_guard lock(mutex_);
    return error_;
}

auto CompletionStatus::errorMessage() const -> std::string {
    auto failure = error();
    if (!failure) {
        return {};
    }
    try {
        std::rethrow_exception(failure);
    } catch (const std::exception& e) {
        return e.what();
    }
    return {};
}

void CompletionStatus::rethrowIfFailed() const {
    if (auto failure = error()) {
        std::rethrow_exception(failure);
    }
}

void CompletionStatus::addCallback(Callback callback) {
    {
        std::lock_guard lock(mutex_);
        if (!done_) {
            callbacks_.push_back(std::move(callback));
            return;
        }
    }
    callback(*this);
}

auto CompletionStatus::elapsed() const -> std::chrono::milliseconds {
    std::lock_guard lock(mutex_);
    auto end = done_ ? resolved_at_ : std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end -
                                                                 created_);
}

}  // namespace flyscan::device
