/*
 * busy_guard.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "busy_guard.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace flyscan::device {

BusyGuard::BusyGuard(AtomBusyFlag& flag) : flag_(&flag) { flag_->set(true); }

BusyGuard::BusyGuard(BusyGuard&& other) noexcept : flag_(other.flag_) {
    other.flag_ = nullptr;
}

BusyGuard::~BusyGuard() {
    if (flag_ == nullptr) {
        return;
    }
    try {
        flag_->set(false);
    } catch (const std::exception& e) {
        spdlog::error("Failed to clear busy record '{}': {}",
                      flag_->getName(), e.what());
    }
}

void BusyGuard::release() {
    if (flag_ == nullptr) {
        return;
    }
    auto* flag = flag_;
    flag_ = nullptr;
    flag->set(false);
}

}  // namespace flyscan::device
