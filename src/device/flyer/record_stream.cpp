/*
 * record_stream.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "record_stream.hpp"

#include <utility>

namespace flyscan::device {

RecordStream::RecordStream(std::vector<AcquisitionRecord> records)
    : records_(std::move(records)) {}

auto RecordStream::next() -> std::optional<AcquisitionRecord> {
    if (exhausted()) {
        return std::nullopt;
    }
    return std::move(records_[cursor_++]);
}

auto RecordStream::remaining() const -> size_t {
    return exhausted() ? 0 : records_.size() - cursor_;
}

auto RecordStream::exhausted() const -> bool {
    return cursor_ >= records_.size();
}

}  // namespace flyscan::device
