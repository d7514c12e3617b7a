// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/format/chunk.hpp>

namespace pavtv::format {

namespace {

template<typename... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};

} // namespace

std::int32_t chunk_type_value(const Chunk& chunk) noexcept {
    return std::visit(Overloaded{
        [](const HeaderChunk&) { return static_cast<std::int32_t>(ChunkType::header); },
        [](const DataChunk&) { return static_cast<std::int32_t>(ChunkType::data); },
        [](const EventChunk& c) { return static_cast<std::int32_t>(c.type); },
        [](const UnknownChunk& c) { return c.type; },
    }, chunk);
}

const Bytes& chunk_data(const Chunk& chunk) noexcept {
    return std::visit([](const auto& c) -> const Bytes& { return c.data; }, chunk);
}

} // namespace pavtv::format
