// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/format/meta_record.hpp>
#include <pavtv/format/timestamp.hpp>
#include <algorithm>
#include <cstring>

namespace pavtv::format {

using core::Error;

namespace {

constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

void push_unit(Bytes& out, std::uint16_t unit) {
    out.push_back(static_cast<std::uint8_t>(unit & 0xFF));
    out.push_back(static_cast<std::uint8_t>(unit >> 8));
}

// Decode one code point starting at s[i], advancing i
char32_t next_code_point(std::string_view s, std::size_t& i) noexcept {
    const auto lead = static_cast<unsigned char>(s[i++]);
    if (lead < 0x80) return lead;

    std::size_t extra = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1; cp = lead & 0x1F; min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2; cp = lead & 0x0F; min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3; cp = lead & 0x07; min = 0x10000;
    } else {
        return REPLACEMENT_CHAR;
    }

    for (std::size_t k = 0; k < extra; ++k) {
        if (i >= s.size()) return REPLACEMENT_CHAR;
        const auto cont = static_cast<unsigned char>(s[i]);
        if ((cont & 0xC0) != 0x80) return REPLACEMENT_CHAR;
        cp = (cp << 6) | (cont & 0x3F);
        ++i;
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return REPLACEMENT_CHAR;
    }
    return cp;
}

} // namespace

std::string display_name(const core::MetaData& meta) {
    std::string s;
    s.reserve(meta.game_mode.size() + meta.friendly_name.size() + meta.workshop_mods.size() + 32);
    s += meta.game_mode;
    s += ',';
    s += meta.friendly_name;
    s += ',';
    s += meta.competitive ? "competitive" : "casual";
    s += ",0,";
    s += meta.workshop_mods;
    s += ',';
    s += meta.live ? "true" : "false";
    return s;
}

Bytes encode_utf16le(std::string_view utf8) {
    Bytes out;
    out.reserve(utf8.size() * 2);

    std::size_t i = 0;
    while (i < utf8.size()) {
        char32_t cp = next_code_point(utf8, i);
        if (cp >= 0x10000) {
            cp -= 0x10000;
            push_unit(out, static_cast<std::uint16_t>(0xD800 + (cp >> 10)));
            push_unit(out, static_cast<std::uint16_t>(0xDC00 + (cp & 0x3FF)));
        } else {
            push_unit(out, static_cast<std::uint16_t>(cp));
        }
    }
    return out;
}

Bytes friendly_name_block(std::string_view name) {
    Bytes block(FRIENDLY_NAME_SIZE, 0);
    for (std::size_t i = 0; i < FRIENDLY_NAME_SIZE - 2; i += 2) {
        block[i] = 0x20;
        block[i + 1] = 0x00;
    }
    block[FRIENDLY_NAME_SIZE - 2] = 0x00;
    block[FRIENDLY_NAME_SIZE - 1] = 0x00;

    const Bytes encoded = encode_utf16le(name);
    const std::size_t copy_len = std::min(encoded.size(), FRIENDLY_NAME_SIZE);
    std::memcpy(block.data(), encoded.data(), copy_len);
    return block;
}

std::expected<Bytes, Error> build_meta(const core::MetaData& meta) {
    auto created = parse_created(meta.created);
    if (!created) {
        return std::unexpected(created.error());
    }

    WriteBuffer buf(META_RECORD_SIZE);

    const Bytes name_block = friendly_name_block(display_name(meta));

    for (std::int32_t v : {META_MAGIC, META_FILE_VERSION, meta.total_time, meta.version, 0, -257}) {
        if (auto ok = buf.write_int32(v); !ok) return std::unexpected(ok.error());
    }
    if (auto ok = buf.write_bytes(name_block); !ok) return std::unexpected(ok.error());
    if (auto ok = buf.write_int32(meta.live ? 1 : 0); !ok) return std::unexpected(ok.error());
    if (auto ok = buf.write_int64(to_ticks(created->unix_millis)); !ok) return std::unexpected(ok.error());
    for (int i = 0; i < 3; ++i) {
        if (auto ok = buf.write_int32(0); !ok) return std::unexpected(ok.error());
    }

    if (auto ok = buf.validate(META_RECORD_SIZE); !ok) {
        return std::unexpected(ok.error());
    }
    return std::move(buf).release();
}

} // namespace pavtv::format
