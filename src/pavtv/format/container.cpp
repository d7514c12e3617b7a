// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/format/container.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <limits>
#include <string>

namespace pavtv::format {

using core::Error;
using core::ReplayErrc;

namespace {

constexpr std::size_t MAX_FIELD = static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());

std::expected<void, Error> check_field(std::size_t size, const char* what) {
    if (size > MAX_FIELD) {
        return std::unexpected(Error(ReplayErrc::format_error,
            std::string(what) + " of " + std::to_string(size)
            + " bytes does not fit a 32-bit length field"));
    }
    return {};
}

// Every length written into the container must fit an i32
std::expected<void, Error> check_limits(const Chunk& chunk) {
    if (auto ok = check_field(chunk_data(chunk).size(), "chunk data"); !ok) return ok;
    if (const auto* ev = std::get_if<EventChunk>(&chunk)) {
        if (auto ok = check_field(string_buffer_size(ev->id), "event id"); !ok) return ok;
        if (auto ok = check_field(string_buffer_size(ev->group), "event group"); !ok) return ok;
        if (auto ok = check_field(string_buffer_size(ev->metadata.value_or("")), "event metadata"); !ok) return ok;
    }
    return check_field(chunk_body_size(chunk), "chunk body");
}

std::expected<void, Error> write_body(WriteBuffer& out, const Chunk& chunk) {
    if (const auto* header = std::get_if<HeaderChunk>(&chunk)) {
        return out.write_bytes(header->data);
    }

    if (const auto* data = std::get_if<DataChunk>(&chunk)) {
        const auto data_len = static_cast<std::int32_t>(data->data.size());
        if (auto ok = out.write_int32(data->time1); !ok) return ok;
        if (auto ok = out.write_int32(data->time2); !ok) return ok;
        if (auto ok = out.write_int32(data_len); !ok) return ok;
        if (auto ok = out.write_int32(data->size_in_bytes.value_or(data_len)); !ok) return ok;
        return out.write_bytes(data->data);
    }

    const auto& ev = std::get<EventChunk>(chunk);
    if (auto ok = write_string_buffer(out, ev.id); !ok) return ok;
    if (auto ok = write_string_buffer(out, ev.group); !ok) return ok;
    if (auto ok = write_string_buffer(out, ev.metadata.value_or("")); !ok) return ok;
    if (auto ok = out.write_int32(ev.time1); !ok) return ok;
    if (auto ok = out.write_int32(ev.time2); !ok) return ok;
    if (auto ok = out.write_int32(static_cast<std::int32_t>(ev.data.size())); !ok) return ok;
    return out.write_bytes(ev.data);
}

} // namespace

std::size_t chunk_body_size(const Chunk& chunk) noexcept {
    if (const auto* header = std::get_if<HeaderChunk>(&chunk)) {
        return header->data.size();
    }
    if (const auto* data = std::get_if<DataChunk>(&chunk)) {
        return DATA_PREFIX_SIZE + data->data.size();
    }
    if (const auto* ev = std::get_if<EventChunk>(&chunk)) {
        const std::string_view metadata = ev->metadata ? std::string_view(*ev->metadata) : std::string_view{};
        return string_buffer_size(ev->id)
             + string_buffer_size(ev->group)
             + string_buffer_size(metadata)
             + EVENT_TRAILER_SIZE
             + ev->data.size();
    }
    return 0;
}

std::size_t encoded_size(const ContainerPart& part) noexcept {
    if (const auto* meta = std::get_if<MetaRecord>(&part)) {
        return meta->bytes.size();
    }
    const auto& chunk = std::get<Chunk>(part);
    if (std::holds_alternative<UnknownChunk>(chunk)) {
        return 0;
    }
    return CHUNK_HEADER_SIZE + chunk_body_size(chunk);
}

std::expected<void, Error> write_string_buffer(WriteBuffer& out, std::string_view s) {
    if (auto ok = out.write_int32(static_cast<std::int32_t>(s.size() + 1)); !ok) return ok;
    if (auto ok = out.write_bytes({reinterpret_cast<const std::uint8_t*>(s.data()), s.size()}); !ok) return ok;
    const std::uint8_t nul = 0;
    return out.write_bytes({&nul, 1});
}

std::expected<Bytes, Error> assemble(std::span<const ContainerPart> parts, const AssemblyCallback& on_part) {
    std::size_t total = 0;
    for (const auto& part : parts) {
        if (const auto* chunk = std::get_if<Chunk>(&part)) {
            if (auto ok = check_limits(*chunk); !ok) {
                return std::unexpected(ok.error());
            }
        }
        total += encoded_size(part);
    }

    WriteBuffer out(total);
    std::size_t done = 0;

    for (const auto& part : parts) {
        if (const auto* meta = std::get_if<MetaRecord>(&part)) {
            if (auto ok = out.write_bytes(meta->bytes); !ok) {
                return std::unexpected(ok.error());
            }
        } else {
            const auto& chunk = std::get<Chunk>(part);
            if (std::holds_alternative<UnknownChunk>(chunk)) {
                spdlog::warn("Unknown chunk type encountered: {}", chunk_type_value(chunk));
            } else {
                const auto body_len = static_cast<std::int32_t>(chunk_body_size(chunk));
                if (auto ok = out.write_int32(chunk_type_value(chunk)); !ok) {
                    return std::unexpected(ok.error());
                }
                if (auto ok = out.write_int32(body_len); !ok) {
                    return std::unexpected(ok.error());
                }
                if (auto ok = write_body(out, chunk); !ok) {
                    return std::unexpected(ok.error());
                }
            }
        }

        ++done;
        if (on_part) {
            on_part(done, parts.size());
        }
    }

    if (auto ok = out.validate(total); !ok) {
        return std::unexpected(ok.error());
    }
    return std::move(out).release();
}

} // namespace pavtv::format
