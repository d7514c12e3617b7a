// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/format/write_buffer.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace pavtv::format {

// Chunk type values as written into the 8-byte chunk header
enum class ChunkType : std::int32_t {
    header = 0,
    data = 1,
    checkpoint = 2,
    event = 3,
};

// Type 0: raw replay header bytes
struct HeaderChunk {
    Bytes data;
};

// Type 1: one stream chunk
struct DataChunk {
    Bytes data;
    std::int32_t time1{0};
    std::int32_t time2{0};
    std::optional<std::int32_t> size_in_bytes;  // Defaults to data.size()
};

// Types 2 and 3: checkpoint and Pavlov events share one body layout
struct EventChunk {
    ChunkType type{ChunkType::event};
    std::string id;
    std::string group;
    std::optional<std::string> metadata;        // Written as "" when absent
    std::int32_t time1{0};
    std::int32_t time2{0};
    Bytes data;
};

// A type value this library does not produce. Skipped on assembly.
struct UnknownChunk {
    std::int32_t type{0};
    Bytes data;
};

using Chunk = std::variant<HeaderChunk, DataChunk, EventChunk, UnknownChunk>;

[[nodiscard]] std::int32_t chunk_type_value(const Chunk& chunk) noexcept;

[[nodiscard]] const Bytes& chunk_data(const Chunk& chunk) noexcept;

} // namespace pavtv::format
