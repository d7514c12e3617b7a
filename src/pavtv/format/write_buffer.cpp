// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/format/write_buffer.hpp>
#include <cstring>
#include <string>
#include <type_traits>

namespace pavtv::format {

using core::Error;
using core::ReplayErrc;

namespace {

template<typename T>
void store_le(std::uint8_t* out, T value) noexcept {
    auto v = static_cast<std::make_unsigned_t<T>>(value);
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        out[i] = static_cast<std::uint8_t>(v & 0xFF);
        v >>= 8;
    }
}

} // namespace

WriteBuffer::WriteBuffer(std::size_t capacity)
    : buffer_(capacity, 0) {}

std::expected<void, Error> WriteBuffer::reserve_span(std::size_t size, const char* op) const {
    if (size > buffer_.size() - pos_) {
        return std::unexpected(Error(ReplayErrc::format_error,
            std::string("Buffer overflow in ") + op + ": " + std::to_string(size)
            + " bytes at offset " + std::to_string(pos_)
            + ", capacity " + std::to_string(buffer_.size())));
    }
    return {};
}

std::expected<void, Error> WriteBuffer::write_int32(std::int32_t value) {
    if (auto ok = reserve_span(4, "write_int32"); !ok) {
        return ok;
    }
    store_le(buffer_.data() + pos_, value);
    pos_ += 4;
    return {};
}

std::expected<void, Error> WriteBuffer::write_int64(std::int64_t value) {
    if (auto ok = reserve_span(8, "write_int64"); !ok) {
        return ok;
    }
    store_le(buffer_.data() + pos_, value);
    pos_ += 8;
    return {};
}

std::expected<void, Error> WriteBuffer::write_bytes(std::span<const std::uint8_t> bytes) {
    if (auto ok = reserve_span(bytes.size(), "write_bytes"); !ok) {
        return ok;
    }
    if (!bytes.empty()) {
        std::memcpy(buffer_.data() + pos_, bytes.data(), bytes.size());
    }
    pos_ += bytes.size();
    return {};
}

std::expected<void, Error> WriteBuffer::validate(std::size_t expected) const {
    if (pos_ != expected) {
        return std::unexpected(Error(ReplayErrc::format_error,
            "Invalid buffer size. Expected to write " + std::to_string(expected)
            + " bytes, instead wrote " + std::to_string(pos_)));
    }
    return {};
}

} // namespace pavtv::format
