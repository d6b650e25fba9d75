/*
 * busy_guard.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: Scoped ownership of a busy record

**************************************************/

#ifndef FLYSCAN_DEVICE_FLYER_BUSY_GUARD_HPP
#define FLYSCAN_DEVICE_FLYER_BUSY_GUARD_HPP

#include "device/template/busy_flag.hpp"

namespace flyscan::device {

/**
 * @brief Sets a busy record on construction and clears it on every exit
 *
 * release() clears the record and reports a failed write. The destructor
 * clears it when release() was never reached, logging a failed write.
 */
class BusyGuard {
public:
    /**
     * @throws HardwareCommunicationException if the record cannot be set
     */
    explicit BusyGuard(AtomBusyFlag& flag);
    ~BusyGuard();

    BusyGuard(BusyGuard&& other) noexcept;
    BusyGuard& operator=(BusyGuard&&) = delete;
    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

    void release();

    [[nodiscard]] auto held() const noexcept -> bool { return flag_ != nullptr; }

private:
    AtomBusyFlag* flag_;
};

}  // namespace flyscan::device

#endif  // FLYSCAN_DEVICE_FLYER_BUSY_GUARD_HPP
