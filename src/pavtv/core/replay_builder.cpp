// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/core/replay_builder.hpp>
#include <pavtv/format/meta_record.hpp>
#include <pavtv/format/timestamp.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <system_error>

namespace pavtv::core {

namespace fs = std::filesystem;

std::optional<format::EventChunk>
make_event_chunk(const Event& event, format::ChunkType type) {
    if (!event.id || !event.group) {
        return std::nullopt;
    }

    format::EventChunk chunk;
    chunk.type = type;
    chunk.id = *event.id;
    chunk.group = *event.group;
    chunk.metadata = event.meta;
    chunk.time1 = event.time1.value_or(0);
    chunk.time2 = event.time2.value_or(0);

    if (event.data && event.data->type == "Buffer" && event.data->data) {
        chunk.data = *event.data->data;
    }
    return chunk;
}

std::expected<format::Bytes, Error>
build_replay(const MetaData& meta,
             std::vector<format::Chunk> chunks,
             const format::AssemblyCallback& on_part) {
    auto meta_record = format::build_meta(meta);
    if (!meta_record) {
        return std::unexpected(meta_record.error());
    }

    std::vector<format::ContainerPart> parts;
    parts.reserve(chunks.size() + 1);
    parts.emplace_back(format::MetaRecord{std::move(*meta_record)});
    for (auto& chunk : chunks) {
        parts.emplace_back(std::move(chunk));
    }

    auto replay = format::assemble(parts, on_part);
    if (replay) {
        spdlog::info("Assembled replay: {} parts, {} bytes", parts.size(), replay->size());
    }
    return replay;
}

std::string sanitize_name(std::string_view name) {
    std::string out(name);
    for (char& c : out) {
        if (c == ' ' || c == '/' || c == '\\' || c == ':') {
            c = '-';
        }
    }
    return out;
}

std::expected<std::string, Error>
replay_filename(const MetaData& meta, std::string_view id) {
    auto created = format::parse_created(meta.created);
    if (!created) {
        return std::unexpected(created.error());
    }

    std::string name = sanitize_name(meta.friendly_name);
    name += '-';
    name += meta.game_mode;
    name += '-';
    name += format::format_created(*created);
    if (!id.empty()) {
        name += '(';
        name += id;
        name += ')';
    }
    name += ".replay";
    return name;
}

std::expected<fs::path, Error>
save_replay(const fs::path& directory, std::string_view filename, const format::Bytes& bytes) {
    std::error_code ec;
    if (!directory.empty()) {
        fs::create_directories(directory, ec);
        if (ec) {
            return std::unexpected(Error(ReplayErrc::io_error,
                "Cannot create directory " + directory.string() + ": " + ec.message()));
        }
    }

    const fs::path path = directory / fs::path(std::string(filename));
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return std::unexpected(Error(ReplayErrc::io_error, "Cannot open " + path.string() + " for writing"));
    }

    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        return std::unexpected(Error(ReplayErrc::io_error, "Failed to save replay file " + path.string()));
    }

    spdlog::info("Wrote {} bytes to {}", bytes.size(), path.string());
    return path;
}

} // namespace pavtv::core
