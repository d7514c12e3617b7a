// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/core/error.hpp>
#include <pavtv/core/models.hpp>
#include <pavtv/core/progress.hpp>
#include <pavtv/format/write_buffer.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <limits>

namespace pavtv::core {

// Caps and progress sink for the local-disk pipeline
struct LocalConfig {
    static constexpr std::size_t UNLIMITED = std::numeric_limits<std::size_t>::max();

    std::size_t data_count{UNLIMITED};        // Max stream files
    std::size_t event_count{UNLIMITED};       // Max Pavlov events
    std::size_t checkpoint_count{UNLIMITED};  // Max checkpoint events
    LocalProgressCallback callback;
};

// <executable dir>/replay_chunks
[[nodiscard]] std::filesystem::path default_chunks_dir();

// Build a container from metadata.json, timing.json, replay.header and
// stream.N files in `chunk_dir`.
[[nodiscard]] std::expected<format::Bytes, Error>
process_local(const LocalConfig& config, const std::filesystem::path& chunk_dir);

// As process_local, then write "{name}-{mode}-{date}.replay" into `out_dir`
[[nodiscard]] std::expected<std::filesystem::path, Error>
process_local_to(const LocalConfig& config,
                 const std::filesystem::path& chunk_dir,
                 const std::filesystem::path& out_dir);

} // namespace pavtv::core
