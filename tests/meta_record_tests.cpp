// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <pavtv/format/meta_record.hpp>
#include <pavtv/format/timestamp.hpp>
#include <cstring>

using namespace pavtv::format;
using pavtv::core::MetaData;
using pavtv::core::ReplayErrc;

namespace {

MetaData sample_meta() {
    MetaData m;
    m.game_mode = "SND";
    m.friendly_name = "Dust";
    m.competitive = true;
    m.workshop_mods = "UGC1";
    m.live = false;
    m.total_time = 1234;
    m.version = 7;
    m.created = "2021-01-01T00:00:00Z";
    return m;
}

std::int32_t read_i32(const Bytes& b, std::size_t at) {
    std::uint32_t v = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        v |= static_cast<std::uint32_t>(b[at + i]) << (8 * i);
    }
    return static_cast<std::int32_t>(v);
}

std::int64_t read_i64(const Bytes& b, std::size_t at) {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        v |= static_cast<std::uint64_t>(b[at + i]) << (8 * i);
    }
    return static_cast<std::int64_t>(v);
}

} // namespace

TEST_CASE("Timestamp ticks", "[timestamp]") {
    CHECK(to_ticks(0) == 621'355'968'000'000'000);
    CHECK(to_ticks(1000) == 621'355'968'010'000'000);
}

TEST_CASE("parse_created accepts RFC3339 and epoch seconds", "[timestamp]") {
    SECTION("UTC") {
        auto ts = parse_created("2021-01-01T00:00:00Z");
        REQUIRE(ts);
        CHECK(ts->unix_millis == 1'609'459'200'000);
        CHECK(ts->offset_minutes == 0);
    }

    SECTION("Fractional seconds") {
        auto ts = parse_created("2021-01-01T00:00:00.250Z");
        REQUIRE(ts);
        CHECK(ts->unix_millis == 1'609'459'200'250);
    }

    SECTION("Positive offset keeps wall-clock for formatting") {
        auto ts = parse_created("2021-01-01T02:00:00+02:00");
        REQUIRE(ts);
        CHECK(ts->unix_millis == 1'609'459'200'000);
        CHECK(ts->offset_minutes == 120);
        CHECK(format_created(*ts) == "2021.01.01-02.00.00");
    }

    SECTION("Integer seconds") {
        auto ts = parse_created("1609459200");
        REQUIRE(ts);
        CHECK(ts->unix_millis == 1'609'459'200'000);
        CHECK(format_created(*ts) == "2021.01.01-00.00.00");
    }

    SECTION("Garbage") {
        for (const char* bad : {"", "yesterday", "2021-13-01T00:00:00Z", "2021-01-01T00:00:00", "12x"}) {
            auto ts = parse_created(bad);
            REQUIRE_FALSE(ts);
            CHECK(ts.error().is(ReplayErrc::format_error));
        }
    }
}

TEST_CASE("display_name layout", "[meta]") {
    auto m = sample_meta();
    CHECK(display_name(m) == "SND,Dust,competitive,0,UGC1,false");

    m.competitive = false;
    m.live = true;
    CHECK(display_name(m) == "SND,Dust,casual,0,UGC1,true");
}

TEST_CASE("UTF-16LE encoding", "[meta]") {
    SECTION("ASCII") {
        CHECK(encode_utf16le("Ab") == Bytes{'A', 0, 'b', 0});
    }

    SECTION("Two-byte sequence") {
        // U+00E9
        CHECK(encode_utf16le("\xC3\xA9") == Bytes{0xE9, 0x00});
    }

    SECTION("Surrogate pair") {
        // U+1F600
        CHECK(encode_utf16le("\xF0\x9F\x98\x80") == Bytes{0x3D, 0xD8, 0x00, 0xDE});
    }

    SECTION("Malformed byte becomes replacement character") {
        CHECK(encode_utf16le("\xFF") == Bytes{0xFD, 0xFF});
    }
}

TEST_CASE("Friendly name block", "[meta]") {
    SECTION("Short name is space padded and NUL terminated") {
        auto block = friendly_name_block("Hi");
        REQUIRE(block.size() == FRIENDLY_NAME_SIZE);
        CHECK(block[0] == 'H');
        CHECK(block[1] == 0);
        CHECK(block[2] == 'i');
        CHECK(block[3] == 0);
        CHECK(block[4] == 0x20);
        CHECK(block[5] == 0x00);
        CHECK(block[510] == 0x20);
        CHECK(block[512] == 0x00);
        CHECK(block[513] == 0x00);
    }

    SECTION("Long name overwrites the terminator") {
        const std::string name(300, 'x');
        auto block = friendly_name_block(name);
        REQUIRE(block.size() == FRIENDLY_NAME_SIZE);
        CHECK(block[512] == 'x');
        CHECK(block[513] == 0x00);
    }

    SECTION("Code unit ending at the block end is kept") {
        // 256 ASCII chars (512 bytes) followed by U+0101, whose units land
        // at 512..513 and fill the block exactly; one more char is dropped.
        std::string name(256, 'a');
        name += "\xC4\x81";
        name += "z";
        auto block = friendly_name_block(name);
        CHECK(block[512] == 0x01);
        CHECK(block[513] == 0x01);
    }

    SECTION("Cut at byte level leaves a lone high surrogate") {
        // U+1F600 encodes as D83D DE00; only the high surrogate fits
        std::string name(256, 'a');
        name += "\xF0\x9F\x98\x80";
        REQUIRE(encode_utf16le(name).size() == FRIENDLY_NAME_SIZE + 2);

        auto block = friendly_name_block(name);
        REQUIRE(block.size() == FRIENDLY_NAME_SIZE);
        CHECK(block[511] == 0x00);
        CHECK(block[512] == 0x3D);
        CHECK(block[513] == 0xD8);
    }
}

TEST_CASE("build_meta record layout", "[meta]") {
    auto record = build_meta(sample_meta());
    REQUIRE(record);
    REQUIRE(record->size() == META_RECORD_SIZE);
    REQUIRE(record->size() == 562);

    const Bytes& b = *record;
    CHECK(read_i32(b, 0) == META_MAGIC);
    CHECK(read_i32(b, 4) == 6);
    CHECK(read_i32(b, 8) == 1234);
    CHECK(read_i32(b, 12) == 7);
    CHECK(read_i32(b, 16) == 0);
    CHECK(read_i32(b, 20) == -257);

    const Bytes expected_name = friendly_name_block("SND,Dust,competitive,0,UGC1,false");
    CHECK(std::memcmp(b.data() + 24, expected_name.data(), FRIENDLY_NAME_SIZE) == 0);

    CHECK(read_i32(b, 538) == 0);   // live
    CHECK(read_i64(b, 542) == to_ticks(1'609'459'200'000));
    CHECK(read_i32(b, 550) == 0);
    CHECK(read_i32(b, 554) == 0);
    CHECK(read_i32(b, 558) == 0);
}

TEST_CASE("build_meta size does not depend on the name", "[meta]") {
    auto m = sample_meta();
    m.friendly_name = std::string(1000, 'n');
    m.live = true;

    auto record = build_meta(m);
    REQUIRE(record);
    CHECK(record->size() == 562);
    CHECK(read_i32(*record, 538) == 1);
}

TEST_CASE("build_meta rejects an invalid created value", "[meta]") {
    auto m = sample_meta();
    m.created = "not a date";
    auto record = build_meta(m);
    REQUIRE_FALSE(record);
    CHECK(record.error().is(ReplayErrc::format_error));
}
