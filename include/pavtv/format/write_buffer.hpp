// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/core/error.hpp>
#include <cstdint>
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace pavtv::format {

using Bytes = std::vector<std::uint8_t>;

// Fixed-capacity little-endian writer. Capacity is set once at construction;
// any write past it fails instead of growing the buffer.
class WriteBuffer {
public:
    explicit WriteBuffer(std::size_t capacity);

    [[nodiscard]] std::expected<void, core::Error> write_int32(std::int32_t value);
    [[nodiscard]] std::expected<void, core::Error> write_int64(std::int64_t value);
    [[nodiscard]] std::expected<void, core::Error> write_bytes(std::span<const std::uint8_t> bytes);

    // Fails unless exactly `expected` bytes have been written
    [[nodiscard]] std::expected<void, core::Error> validate(std::size_t expected) const;

    [[nodiscard]] std::size_t offset() const noexcept { return pos_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] const std::uint8_t* data() const noexcept { return buffer_.data(); }

    // Release the underlying storage (full capacity, including unwritten tail)
    [[nodiscard]] Bytes release() && noexcept { return std::move(buffer_); }

private:
    [[nodiscard]] std::expected<void, core::Error> reserve_span(std::size_t size, const char* op) const;

    Bytes buffer_;
    std::size_t pos_{0};
};

} // namespace pavtv::format
