// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <pavtv/core/replay_builder.hpp>
#include <pavtv/format/meta_record.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace pavtv::core;
namespace fs = std::filesystem;

namespace {

MetaData sample_meta() {
    MetaData m;
    m.game_mode = "SND";
    m.friendly_name = "Dust II: Night";
    m.workshop_mods = "";
    m.total_time = 10;
    m.version = 1;
    m.created = "2021-06-15T13:45:30Z";
    return m;
}

fs::path temp_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / ("pavtv_builder_" + name);
    fs::remove_all(dir);
    return dir;
}

} // namespace

TEST_CASE("sanitize_name replaces path-hostile characters", "[builder]") {
    CHECK(sanitize_name("a b/c\\d:e") == "a-b-c-d-e");
    CHECK(sanitize_name("plain") == "plain");
    CHECK(sanitize_name("") == "");
}

TEST_CASE("replay_filename", "[builder]") {
    SECTION("With id") {
        auto name = replay_filename(sample_meta(), "abc123");
        REQUIRE(name);
        CHECK(*name == "Dust-II--Night-SND-2021.06.15-13.45.30(abc123).replay");
    }

    SECTION("Without id") {
        auto name = replay_filename(sample_meta());
        REQUIRE(name);
        CHECK(*name == "Dust-II--Night-SND-2021.06.15-13.45.30.replay");
    }

    SECTION("Invalid created") {
        auto meta = sample_meta();
        meta.created = "soon";
        auto name = replay_filename(meta, "x");
        REQUIRE_FALSE(name);
        CHECK(name.error().is(ReplayErrc::format_error));
    }
}

TEST_CASE("make_event_chunk", "[builder]") {
    Event event;
    event.id = "e";
    event.group = "checkpoint";
    event.time1 = 3;
    event.data = EventData{"Buffer", std::vector<std::uint8_t>{4, 5}};

    SECTION("Buffer payload is kept") {
        auto chunk = make_event_chunk(event, pavtv::format::ChunkType::checkpoint);
        REQUIRE(chunk);
        CHECK(chunk->type == pavtv::format::ChunkType::checkpoint);
        CHECK(chunk->id == "e");
        CHECK(chunk->time1 == 3);
        CHECK(chunk->time2 == 0);
        CHECK_FALSE(chunk->metadata);
        CHECK(chunk->data == pavtv::format::Bytes{4, 5});
    }

    SECTION("Other payload types are dropped") {
        event.data->type = "Json";
        auto chunk = make_event_chunk(event, pavtv::format::ChunkType::event);
        REQUIRE(chunk);
        CHECK(chunk->data.empty());
    }

    SECTION("id and group are required") {
        auto no_id = event;
        no_id.id.reset();
        CHECK_FALSE(make_event_chunk(no_id, pavtv::format::ChunkType::event));

        auto no_group = event;
        no_group.group.reset();
        CHECK_FALSE(make_event_chunk(no_group, pavtv::format::ChunkType::event));
    }
}

TEST_CASE("build_replay prepends the meta record", "[builder]") {
    std::vector<pavtv::format::Chunk> chunks;
    chunks.emplace_back(pavtv::format::HeaderChunk{{1, 2, 3}});

    std::size_t parts_seen = 0;
    auto bytes = build_replay(sample_meta(), std::move(chunks),
                              [&](std::size_t, std::size_t total) { parts_seen = total; });
    REQUIRE(bytes);
    CHECK(bytes->size() == pavtv::format::META_RECORD_SIZE + 8 + 3);
    CHECK(parts_seen == 2);
}

TEST_CASE("save_replay writes into a new directory", "[builder]") {
    const auto dir = temp_dir("save") / "nested";
    const pavtv::format::Bytes bytes{1, 2, 3, 4};

    auto path = save_replay(dir, "out.replay", bytes);
    REQUIRE(path);
    CHECK(*path == dir / "out.replay");

    std::ifstream in(*path, std::ios::binary);
    std::vector<std::uint8_t> read((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(read == bytes);

    fs::remove_all(dir.parent_path());
}

TEST_CASE("save_replay reports an unwritable target", "[builder]") {
    const auto dir = temp_dir("blocked");
    fs::create_directories(dir);
    {
        std::ofstream blocker(dir / "file");
    }

    // A regular file where a directory is expected
    auto path = save_replay(dir / "file" / "sub", "x.replay", {});
    REQUIRE_FALSE(path);
    CHECK(path.error().is(ReplayErrc::io_error));

    fs::remove_all(dir);
}
