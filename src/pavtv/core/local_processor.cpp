// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/core/local_processor.hpp>
#include <pavtv/core/json_model.hpp>
#include <pavtv/core/replay_builder.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace pavtv::core {

namespace fs = std::filesystem;

namespace {

struct LocalReplay {
    MetaData meta;
    format::Bytes bytes;
};

std::expected<format::Bytes, Error> read_file(const fs::path& path, std::string_view what) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(Error(ReplayErrc::io_error,
            std::string(what) + " not found at " + path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(Error(ReplayErrc::io_error, "Cannot open " + path.string()));
    }

    format::Bytes bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::unexpected(Error(ReplayErrc::io_error, "Failed to read " + path.string()));
    }
    return bytes;
}

template<typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Numeric part of "stream.N"; files without one sort as 0
std::int32_t stream_number(const fs::path& path) {
    const std::string name = path.filename().string();
    const auto first = name.find('.');
    if (first == std::string::npos) return 0;
    const auto second = name.find('.', first + 1);
    const std::size_t len = second == std::string::npos ? std::string::npos : second - first - 1;
    return parse_number<std::int32_t>(std::string_view(name).substr(first + 1, len)).value_or(0);
}

std::expected<std::vector<fs::path>, Error> list_stream_files(const fs::path& dir) {
    std::vector<std::pair<std::int32_t, fs::path>> found;

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& path = it->path();
        if (path.filename().string().starts_with("stream.")) {
            found.emplace_back(stream_number(path), path);
        }
    }
    if (ec) {
        return std::unexpected(Error(ReplayErrc::io_error, "Cannot read directory " + dir.string() + ": " + ec.message()));
    }

    std::sort(found.begin(), found.end());

    std::vector<fs::path> paths;
    paths.reserve(found.size());
    for (auto& f : found) {
        paths.push_back(std::move(f.second));
    }
    return paths;
}

// Timing entry whose numchunks equals chunk_number
const TimingEntry* find_timing(const std::vector<TimingEntry>& timing, std::size_t chunk_number) {
    auto it = std::find_if(timing.begin(), timing.end(), [&](const TimingEntry& t) {
        auto n = parse_number<std::size_t>(t.numchunks);
        return n && *n == chunk_number;
    });
    return it == timing.end() ? nullptr : &*it;
}

class LocalPipeline {
public:
    LocalPipeline(const LocalConfig& config, fs::path dir)
        : config_(config), dir_(std::move(dir)) {}

    std::expected<LocalReplay, Error> run() {
        auto metadata_text = read_file(dir_ / "metadata.json", "Metadata");
        if (!metadata_text) return std::unexpected(metadata_text.error());
        auto timing_text = read_file(dir_ / "timing.json", "Timing Data");
        if (!timing_text) return std::unexpected(timing_text.error());

        auto metadata = parse_local_metadata(as_text(*metadata_text), (dir_ / "metadata.json").string());
        if (!metadata) return std::unexpected(metadata.error());
        auto timing = parse_timing(as_text(*timing_text), (dir_ / "timing.json").string());
        if (!timing) return std::unexpected(timing.error());

        if (!metadata->meta) {
            return std::unexpected(Error(ReplayErrc::parse_error, "Invalid metadata: missing 'meta' field"));
        }

        const std::vector<Event> no_events;
        const auto& pavlov = metadata->events_pavlov ? metadata->events_pavlov->events : no_events;
        const auto& checkpoints = metadata->events ? metadata->events->events : no_events;

        auto header = read_file(dir_ / "replay.header", "Chunk file");
        if (!header) return std::unexpected(header.error());
        chunks_.emplace_back(format::HeaderChunk{std::move(*header)});

        auto streams = list_stream_files(dir_);
        if (!streams) return std::unexpected(streams.error());

        progress_.header = {0, 1};
        progress_.data_chunks = {0, std::min(streams->size(), config_.data_count)};
        progress_.event_chunks = {0, std::min(pavlov.size(), config_.event_count)};
        progress_.checkpoint_chunks = {0, std::min(checkpoints.size(), config_.checkpoint_count)};
        publish();

        progress_.header.current = 1;
        publish();

        if (auto ok = add_streams(*streams, *timing); !ok) {
            return std::unexpected(ok.error());
        }

        // Pavlov events precede checkpoints in this pipeline
        add_events(pavlov, format::ChunkType::event, config_.event_count, progress_.event_chunks);
        add_events(checkpoints, format::ChunkType::checkpoint, config_.checkpoint_count, progress_.checkpoint_chunks);

        auto bytes = build_replay(*metadata->meta, std::move(chunks_));
        if (!bytes) return std::unexpected(bytes.error());

        return LocalReplay{std::move(*metadata->meta), std::move(*bytes)};
    }

private:
    static std::string_view as_text(const format::Bytes& bytes) noexcept {
        return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    }

    void publish() {
        if (config_.callback) {
            config_.callback(progress_);
        }
    }

    std::expected<void, Error> add_streams(const std::vector<fs::path>& streams, const std::vector<TimingEntry>& timing) {
        for (std::size_t index = 0; index < streams.size(); ++index) {
            if (index >= config_.data_count) {
                break;
            }

            auto data = read_file(streams[index], "Chunk file");
            if (!data) return std::unexpected(data.error());
            if (data->empty()) {
                spdlog::warn("Skipping empty stream file {}", streams[index].string());
                continue;
            }

            format::DataChunk chunk;
            if (const TimingEntry* t = find_timing(timing, index + 1)) {
                chunk.time1 = parse_number<std::int32_t>(t->mtime1).value_or(0);
                chunk.time2 = parse_number<std::int32_t>(t->mtime2).value_or(0);
            }
            chunk.data = std::move(*data);
            chunks_.emplace_back(std::move(chunk));

            progress_.data_chunks.current = index + 1;
            publish();
        }
        return {};
    }

    void add_events(const std::vector<Event>& events, format::ChunkType type,
                    std::size_t cap, ProgressCounters& counters) {
        for (std::size_t index = 0; index < events.size() && index < cap; ++index) {
            if (auto chunk = make_event_chunk(events[index], type)) {
                chunks_.emplace_back(std::move(*chunk));
            } else {
                spdlog::warn("Dropping event {} without id/group (type {})", index, static_cast<int>(type));
            }
            counters.current = index + 1;
            publish();
        }
    }

    const LocalConfig& config_;
    fs::path dir_;
    LocalProgress progress_;
    std::vector<format::Chunk> chunks_;
};

} // namespace

fs::path default_chunks_dir() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || !exe.has_parent_path()) {
        return fs::path(".") / "replay_chunks";
    }
    return exe.parent_path() / "replay_chunks";
}

std::expected<format::Bytes, Error>
process_local(const LocalConfig& config, const fs::path& chunk_dir) {
    auto replay = LocalPipeline(config, chunk_dir).run();
    if (!replay) {
        return std::unexpected(replay.error());
    }
    return std::move(replay->bytes);
}

std::expected<fs::path, Error>
process_local_to(const LocalConfig& config, const fs::path& chunk_dir, const fs::path& out_dir) {
    auto replay = LocalPipeline(config, chunk_dir).run();
    if (!replay) {
        return std::unexpected(replay.error());
    }

    auto filename = replay_filename(replay->meta);
    if (!filename) {
        return std::unexpected(filename.error());
    }
    return save_replay(out_dir, *filename, replay->bytes);
}

} // namespace pavtv::core
