// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <pavtv/format/write_buffer.hpp>
#include <array>

using namespace pavtv::format;
using pavtv::core::ReplayErrc;

TEST_CASE("WriteBuffer little-endian writes", "[write_buffer]") {
    WriteBuffer buf(12);

    REQUIRE(buf.write_int32(0x01020304));
    REQUIRE(buf.write_int64(-2));
    CHECK(buf.offset() == 12);

    const auto bytes = std::move(buf).release();
    REQUIRE(bytes.size() == 12);
    CHECK(bytes[0] == 0x04);
    CHECK(bytes[1] == 0x03);
    CHECK(bytes[2] == 0x02);
    CHECK(bytes[3] == 0x01);
    CHECK(bytes[4] == 0xFE);
    for (std::size_t i = 5; i < 12; ++i) {
        CHECK(bytes[i] == 0xFF);
    }
}

TEST_CASE("WriteBuffer rejects writes past capacity", "[write_buffer]") {
    SECTION("int32 into 3 bytes") {
        WriteBuffer buf(3);
        auto result = buf.write_int32(1);
        REQUIRE_FALSE(result);
        CHECK(result.error().is(ReplayErrc::format_error));
        CHECK_THAT(result.error().detail, Catch::Matchers::ContainsSubstring("write_int32"));
        CHECK(buf.offset() == 0);
    }

    SECTION("int64 after partial fill") {
        WriteBuffer buf(8);
        REQUIRE(buf.write_int32(7));
        auto result = buf.write_int64(1);
        REQUIRE_FALSE(result);
        CHECK_THAT(result.error().detail, Catch::Matchers::ContainsSubstring("write_int64"));
        CHECK(buf.offset() == 4);
    }

    SECTION("bytes larger than remaining space") {
        WriteBuffer buf(4);
        const std::array<std::uint8_t, 5> data{1, 2, 3, 4, 5};
        auto result = buf.write_bytes(data);
        REQUIRE_FALSE(result);
        CHECK_THAT(result.error().detail, Catch::Matchers::ContainsSubstring("write_bytes"));
    }

    SECTION("empty write into a full buffer") {
        WriteBuffer buf(0);
        CHECK(buf.write_bytes({}));
    }
}

TEST_CASE("WriteBuffer::validate compares written size", "[write_buffer]") {
    WriteBuffer buf(8);
    REQUIRE(buf.write_int32(0));

    CHECK_FALSE(buf.validate(8));
    CHECK(buf.validate(4));

    auto mismatch = buf.validate(8);
    REQUIRE_FALSE(mismatch);
    CHECK(mismatch.error().detail == "Invalid buffer size. Expected to write 8 bytes, instead wrote 4");
}
