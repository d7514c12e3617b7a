// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/format/chunk.hpp>
#include <pavtv/format/write_buffer.hpp>
#include <pavtv/core/error.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <string_view>
#include <variant>

namespace pavtv::format {

constexpr std::size_t CHUNK_HEADER_SIZE = 8;      // [type:i32][body length:i32]
constexpr std::size_t DATA_PREFIX_SIZE = 16;      // [time1][time2][dataLen][sizeInBytes]
constexpr std::size_t EVENT_TRAILER_SIZE = 12;    // [time1][time2][dataLen]

// Pre-encoded meta record, copied verbatim into the container
struct MetaRecord {
    Bytes bytes;
};

using ContainerPart = std::variant<MetaRecord, Chunk>;

// Called after each part is written: (parts done, total parts)
using AssemblyCallback = std::function<void(std::size_t, std::size_t)>;

// Size of a string buffer: [i32 length][utf8 bytes][NUL]
[[nodiscard]] constexpr std::size_t string_buffer_size(std::string_view s) noexcept {
    return 4 + s.size() + 1;
}

// Body length of a chunk, excluding its 8-byte chunk header. 0 for unknown types.
[[nodiscard]] std::size_t chunk_body_size(const Chunk& chunk) noexcept;

// Bytes a part contributes to the container
[[nodiscard]] std::size_t encoded_size(const ContainerPart& part) noexcept;

// Write one length-prefixed, NUL-terminated UTF-8 string
[[nodiscard]] std::expected<void, core::Error>
write_string_buffer(WriteBuffer& out, std::string_view s);

// Concatenate all parts in order. Output size is computed up front and the
// result is checked against it before returning.
[[nodiscard]] std::expected<Bytes, core::Error>
assemble(std::span<const ContainerPart> parts, const AssemblyCallback& on_part = {});

} // namespace pavtv::format
