/*
 * busy_flag.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: AtomBusyFlag, a boolean interlock record visible to outside
observers

*************************************************/

#pragma once

#include "device.hpp"

namespace flyscan::device {

class AtomBusyFlag : public AtomDriver {
public:
    explicit AtomBusyFlag(std::string name) : AtomDriver(std::move(name)) {
        setType("BusyFlag");
    }

    ~AtomBusyFlag() override = default;

    virtual auto get() const -> bool = 0;
    virtual void set(bool busy) = 0;
};

}  // namespace flyscan::device
