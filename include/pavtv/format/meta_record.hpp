// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/core/error.hpp>
#include <pavtv/core/models.hpp>
#include <pavtv/format/write_buffer.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace pavtv::format {

constexpr std::int32_t META_MAGIC = 0x1CA2E27F;
constexpr std::int32_t META_FILE_VERSION = 6;
constexpr std::size_t FRIENDLY_NAME_SIZE = 514;
constexpr std::size_t META_FIXED_FIELDS_SIZE = 48;
constexpr std::size_t META_RECORD_SIZE = META_FIXED_FIELDS_SIZE + FRIENDLY_NAME_SIZE;  // 562

// "{gameMode},{friendlyName},{competitive|casual},0,{workshopMods},{live}"
[[nodiscard]] std::string display_name(const core::MetaData& meta);

// UTF-8 to UTF-16LE code units. Malformed input becomes U+FFFD.
[[nodiscard]] Bytes encode_utf16le(std::string_view utf8);

// Space-padded, NUL-terminated 514-byte block. Longer names are cut at the
// byte level, which may split the last code unit.
[[nodiscard]] Bytes friendly_name_block(std::string_view name);

// Encode the fixed 562-byte meta record
[[nodiscard]] std::expected<Bytes, core::Error> build_meta(const core::MetaData& meta);

} // namespace pavtv::format
