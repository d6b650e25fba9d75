/*
 * record_stream.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: RecordStream, the one-shot sequence returned by collect()

**************************************************/

#ifndef FLYSCAN_DEVICE_FLYER_RECORD_STREAM_HPP
#define FLYSCAN_DEVICE_FLYER_RECORD_STREAM_HPP

#include <cstddef>
#include <iterator>
#include <optional>
#include <vector>

#include "acquisition_types.hpp"

namespace flyscan::device {

/**
 * @brief Finite, non-restartable sequence of acquisition records
 *
 * Owns the drained result buffer. Every record is handed out once, in
 * insertion order, whether through next() or range-for. A second loop over
 * the same stream only sees what the first one left.
 */
class RecordStream {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = AcquisitionRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const AcquisitionRecord*;
        using reference = const AcquisitionRecord&;

        Iterator() = default;
        explicit Iterator(RecordStream* stream) : stream_(stream) {}

        reference operator*() const {
            return stream_->records_[stream_->cursor_];
        }
        pointer operator->() const { return &**this; }

        Iterator& operator++() {
            ++stream_->cursor_;
            return *this;
        }
        void operator++(int) { ++*this; }

        friend bool operator==(const Iterator& it, std::default_sentinel_t) {
            return it.stream_ == nullptr || it.stream_->exhausted();
        }

    private:
        RecordStream* stream_{nullptr};
    };

    RecordStream() = default;
    explicit RecordStream(std::vector<AcquisitionRecord> records);

    RecordStream(RecordStream&&) noexcept = default;
    RecordStream& operator=(RecordStream&&) noexcept = default;
    RecordStream(const RecordStream&) = delete;
    RecordStream& operator=(const RecordStream&) = delete;

    /**
     * @brief Take the next record, nullopt once exhausted
     */
    [[nodiscard]] auto next() -> std::optional<AcquisitionRecord>;

    [[nodiscard]] auto remaining() const -> size_t;
    [[nodiscard]] auto exhausted() const -> bool;

    Iterator begin() { return Iterator(this); }
    std::default_sentinel_t end() const { return std::default_sentinel; }

private:
    std::vector<AcquisitionRecord> records_;
    size_t cursor_{0};
};

}  // namespace flyscan::device

#endif  // FLYSCAN_DEVICE_FLYER_RECORD_STREAM_HPP
