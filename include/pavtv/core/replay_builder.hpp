// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/core/error.hpp>
#include <pavtv/core/models.hpp>
#include <pavtv/format/chunk.hpp>
#include <pavtv/format/container.hpp>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pavtv::core {

// Convert an event into a checkpoint/event chunk. Returns nullopt unless both
// id and group are present. Body bytes are kept only for "Buffer" payloads.
[[nodiscard]] std::optional<format::EventChunk>
make_event_chunk(const Event& event, format::ChunkType type);

// Encode the meta record and assemble [meta, chunks...] into one container
[[nodiscard]] std::expected<format::Bytes, Error>
build_replay(const MetaData& meta,
             std::vector<format::Chunk> chunks,
             const format::AssemblyCallback& on_part = {});

// Replace ' ', '/', '\\' and ':' with '-'
[[nodiscard]] std::string sanitize_name(std::string_view name);

// "{name}-{gameMode}-{YYYY.MM.DD-HH.MM.SS}({id}).replay"; the "({id})" part
// is omitted when id is empty.
[[nodiscard]] std::expected<std::string, Error>
replay_filename(const MetaData& meta, std::string_view id = {});

// Write bytes to directory/filename, creating the directory if needed
[[nodiscard]] std::expected<std::filesystem::path, Error>
save_replay(const std::filesystem::path& directory,
            std::string_view filename,
            const format::Bytes& bytes);

} // namespace pavtv::core
