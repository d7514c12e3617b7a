// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace pavtv::format {

// 100ns ticks between 0001-01-01 and the Unix epoch
constexpr std::int64_t TICKS_EPOCH_OFFSET = 621'355'968'000'000'000;
constexpr std::int64_t TICKS_PER_MILLISECOND = 10'000;

struct Timestamp {
    std::int64_t unix_millis{0};
    std::int32_t offset_minutes{0};   // UTC offset the value was written in
};

[[nodiscard]] constexpr std::int64_t to_ticks(std::int64_t unix_millis) noexcept {
    return unix_millis * TICKS_PER_MILLISECOND + TICKS_EPOCH_OFFSET;
}

// Parse an RFC3339 timestamp, falling back to integer Unix seconds.
[[nodiscard]] std::expected<Timestamp, core::Error> parse_created(std::string_view text);

// "YYYY.MM.DD-HH.MM.SS" in the timestamp's own offset
[[nodiscard]] std::string format_created(const Timestamp& ts);

} // namespace pavtv::format
