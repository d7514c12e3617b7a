// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <pavtv/core/local_processor.hpp>
#include <pavtv/format/meta_record.hpp>
#include <filesystem>
#include <fstream>

using namespace pavtv::core;
namespace fs = std::filesystem;

namespace {

constexpr const char* META = R"({"gameMode": "TDM", "friendlyName": "Local Map", "competitive": true,
    "workshop_mods": "", "live": false, "totalTime": 30, "__v": 2, "created": "2022-02-02T10:20:30Z"})";

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

// Scratch chunk directory, removed on scope exit
class ChunkDir {
public:
    explicit ChunkDir(const std::string& name)
        : path_(fs::temp_directory_path() / ("pavtv_local_" + name)) {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~ChunkDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

    void standard_files() const {
        write_file(path_ / "metadata.json", std::string(R"({"meta": )") + META + R"(,
            "events": {"events": [{"id": "c1", "group": "checkpoint"}, {"id": "c2", "group": "checkpoint"}]},
            "events_pavlov": {"events": [{"id": "p1", "group": "Pavlov", "data": {"type": "Buffer", "data": [1]}}]}})");
        write_file(path_ / "timing.json", R"([
            {"numchunks": "1", "mtime1": "100", "mtime2": "150"},
            {"numchunks": "2", "mtime1": "200", "mtime2": "oops"}
        ])");
        write_file(path_ / "replay.header", "HDR");
        write_file(path_ / "stream.0", "A");
        write_file(path_ / "stream.1", "B");
        write_file(path_ / "stream.2", "C");
    }

private:
    fs::path path_;
};

std::int32_t read_i32(const pavtv::format::Bytes& b, std::size_t at) {
    std::uint32_t v = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        v |= static_cast<std::uint32_t>(b[at + i]) << (8 * i);
    }
    return static_cast<std::int32_t>(v);
}

// (type, body offset) for each chunk after the meta record
std::vector<std::pair<std::int32_t, std::size_t>> walk_chunks(const pavtv::format::Bytes& bytes) {
    std::vector<std::pair<std::int32_t, std::size_t>> out;
    std::size_t at = pavtv::format::META_RECORD_SIZE;
    while (at + 8 <= bytes.size()) {
        out.emplace_back(read_i32(bytes, at), at + 8);
        at += 8 + static_cast<std::size_t>(read_i32(bytes, at + 4));
    }
    return out;
}

} // namespace

TEST_CASE("Local pipeline chunk order and timing", "[local]") {
    ChunkDir dir("order");
    dir.standard_files();

    auto bytes = process_local(LocalConfig{}, dir.path());
    REQUIRE(bytes);

    const auto chunks = walk_chunks(*bytes);
    // header, 3 streams, 1 Pavlov event, 2 checkpoints
    REQUIRE(chunks.size() == 7);
    CHECK(chunks[0].first == 0);
    CHECK(chunks[1].first == 1);
    CHECK(chunks[2].first == 1);
    CHECK(chunks[3].first == 1);
    CHECK(chunks[4].first == 3);
    CHECK(chunks[5].first == 2);
    CHECK(chunks[6].first == 2);

    // stream.0 matches numchunks 1
    CHECK(read_i32(*bytes, chunks[1].second) == 100);
    CHECK(read_i32(*bytes, chunks[1].second + 4) == 150);
    // unparseable mtime2 becomes 0
    CHECK(read_i32(*bytes, chunks[2].second) == 200);
    CHECK(read_i32(*bytes, chunks[2].second + 4) == 0);
    // no timing entry
    CHECK(read_i32(*bytes, chunks[3].second) == 0);
    CHECK((*bytes)[chunks[3].second + 16] == 'C');
}

TEST_CASE("Local stream files sort numerically", "[local]") {
    ChunkDir dir("numeric");
    dir.standard_files();
    fs::remove(dir.path() / "stream.1");
    write_file(dir.path() / "stream.10", "Z");

    auto bytes = process_local(LocalConfig{}, dir.path());
    REQUIRE(bytes);
    const auto chunks = walk_chunks(*bytes);
    REQUIRE(chunks.size() == 7);
    CHECK((*bytes)[chunks[1].second + 16] == 'A');
    CHECK((*bytes)[chunks[2].second + 16] == 'C');
    CHECK((*bytes)[chunks[3].second + 16] == 'Z');
}

TEST_CASE("Local progress is reported per item", "[local]") {
    ChunkDir dir("progress");
    dir.standard_files();

    std::vector<LocalProgress> updates;
    LocalConfig config;
    config.callback = [&](const LocalProgress& p) { updates.push_back(p); };

    auto bytes = process_local(config, dir.path());
    REQUIRE(bytes);

    // initial, header, 3 streams, 1 Pavlov, 2 checkpoints
    REQUIRE(updates.size() == 8);
    CHECK(updates.front().header.current == 0);
    CHECK(updates.front().data_chunks.max == 3);
    CHECK(updates.front().event_chunks.max == 1);
    CHECK(updates.front().checkpoint_chunks.max == 2);

    // Pavlov events finish before any checkpoint is counted
    CHECK(updates[5].event_chunks.current == 1);
    CHECK(updates[5].checkpoint_chunks.current == 0);

    const auto& last = updates.back();
    CHECK(last.header.current == 1);
    CHECK(last.data_chunks.current == 3);
    CHECK(last.event_chunks.current == 1);
    CHECK(last.checkpoint_chunks.current == 2);
}

TEST_CASE("Local caps limit each group", "[local]") {
    ChunkDir dir("caps");
    dir.standard_files();

    LocalConfig config;
    config.data_count = 2;
    config.event_count = 0;
    config.checkpoint_count = 1;

    auto bytes = process_local(config, dir.path());
    REQUIRE(bytes);
    const auto chunks = walk_chunks(*bytes);
    REQUIRE(chunks.size() == 1 + 2 + 1);
    CHECK(chunks.back().first == 2);
}

TEST_CASE("Empty stream files are skipped", "[local]") {
    ChunkDir dir("empty");
    dir.standard_files();
    write_file(dir.path() / "stream.1", "");

    auto bytes = process_local(LocalConfig{}, dir.path());
    REQUIRE(bytes);
    CHECK(walk_chunks(*bytes).size() == 6);
}

TEST_CASE("Local pipeline failures", "[local]") {
    ChunkDir dir("failures");
    dir.standard_files();

    SECTION("Missing metadata.json") {
        fs::remove(dir.path() / "metadata.json");
        auto bytes = process_local(LocalConfig{}, dir.path());
        REQUIRE_FALSE(bytes);
        CHECK(bytes.error().is(ReplayErrc::io_error));
        CHECK_THAT(bytes.error().detail, Catch::Matchers::ContainsSubstring("Metadata not found"));
    }

    SECTION("Missing timing.json") {
        fs::remove(dir.path() / "timing.json");
        auto bytes = process_local(LocalConfig{}, dir.path());
        REQUIRE_FALSE(bytes);
        CHECK(bytes.error().is(ReplayErrc::io_error));
    }

    SECTION("Missing replay.header") {
        fs::remove(dir.path() / "replay.header");
        auto bytes = process_local(LocalConfig{}, dir.path());
        REQUIRE_FALSE(bytes);
        CHECK(bytes.error().is(ReplayErrc::io_error));
    }

    SECTION("metadata.json without meta") {
        write_file(dir.path() / "metadata.json", R"({"events": {"events": []}})");
        auto bytes = process_local(LocalConfig{}, dir.path());
        REQUIRE_FALSE(bytes);
        CHECK(bytes.error().is(ReplayErrc::parse_error));
    }

    SECTION("Malformed timing.json") {
        write_file(dir.path() / "timing.json", "[{");
        auto bytes = process_local(LocalConfig{}, dir.path());
        REQUIRE_FALSE(bytes);
        CHECK(bytes.error().is(ReplayErrc::parse_error));
    }
}

TEST_CASE("process_local_to names the file without an id", "[local]") {
    ChunkDir dir("save");
    dir.standard_files();
    const auto out = dir.path() / "out";

    auto path = process_local_to(LocalConfig{}, dir.path(), out);
    REQUIRE(path);
    CHECK(path->filename() == "Local-Map-TDM-2022.02.02-10.20.30.replay");
    CHECK(fs::file_size(*path) > pavtv::format::META_RECORD_SIZE);
}
