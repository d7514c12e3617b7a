// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/core/replay_client.hpp>
#include <pavtv/core/fetch_pool.hpp>
#include <pavtv/core/json_model.hpp>
#include <pavtv/core/replay_builder.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <optional>

namespace pavtv::core {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view RECORDED_STATE = "Recorded";

// mtime1/mtime2 response headers; absent or malformed means 0
std::int32_t header_i32(const HttpResponse& response, std::string_view name) {
    auto value = response.header(name);
    if (!value) return 0;

    std::int32_t result = 0;
    auto [end, ec] = std::from_chars(value->data(), value->data() + value->size(), result);
    if (ec != std::errc{} || end != value->data() + value->size()) {
        spdlog::warn("Ignoring malformed '{}' header: '{}'", name, *value);
        return 0;
    }
    return result;
}

void append_events(std::vector<format::Chunk>& chunks, const EventList& list, format::ChunkType type) {
    for (const auto& event : list.events) {
        if (auto chunk = make_event_chunk(event, type)) {
            chunks.emplace_back(std::move(*chunk));
        } else {
            spdlog::warn("Dropping event without id/group (type {})", static_cast<int>(type));
        }
    }
}

} // namespace

//=============================================================================
// ProgressPublisher
//=============================================================================

void ProgressPublisher::download_total(std::size_t max) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.download = {0, max};
    publish_locked();
}

void ProgressPublisher::download_step() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++state_.download.current;
    publish_locked();
}

void ProgressPublisher::build(std::size_t current, std::size_t max) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.build = {current, max};
    publish_locked();
}

OnlineProgress ProgressPublisher::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ProgressPublisher::publish_locked() {
    if (callback_) {
        callback_(state_);
    }
}

//=============================================================================
// ReplayClient
//=============================================================================

ReplayClient::ReplayClient(ClientConfig config)
    : config_(std::move(config))
    , transport_(std::make_shared<HttpSession>(config_)) {}

ReplayClient::ReplayClient(ClientConfig config, std::shared_ptr<HttpTransport> transport, SleepFn sleep)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , sleep_(std::move(sleep)) {}

bool ReplayClient::is_valid_id(std::string_view id) noexcept {
    if (id.empty()) return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    });
}

std::expected<HttpResponse, Error> ReplayClient::get(const std::string& url) {
    return request_with_retry(*transport_, HttpRequest{HttpMethod::get, url}, config_.retry, sleep_);
}

std::expected<HttpResponse, Error> ReplayClient::post(const std::string& url) {
    return request_with_retry(*transport_, HttpRequest{HttpMethod::post, url}, config_.retry, sleep_);
}

std::string ReplayClient::endpoint(std::string_view path) const {
    std::string url = config_.server;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += path;
    return url;
}

std::string ReplayClient::replay_url(std::string_view id, std::string_view tail) const {
    return endpoint("/replay/" + std::string(id) + std::string(tail));
}

std::expected<ReplayPage, Error> ReplayClient::list_replays(std::int64_t offset) {
    const std::string url = endpoint("/find/?game=all&offset=" + std::to_string(offset) + "&live=false");

    auto response = get(url);
    if (!response) {
        return std::unexpected(response.error());
    }
    return parse_replay_page(response->text(), url);
}

std::expected<ReplayDescriptor, Error> ReplayClient::find_replay(std::string_view id) {
    if (!is_valid_id(id)) {
        return std::unexpected(Error(ReplayErrc::invalid_input, "Invalid replay id '" + std::string(id) + "'"));
    }

    std::int64_t offset = 0;
    while (true) {
        auto page = list_replays(offset);
        if (!page) {
            return std::unexpected(page.error());
        }

        auto it = std::find_if(page->replays.begin(), page->replays.end(),
                               [&](const ReplayDescriptor& r) { return r.id == id; });
        if (it != page->replays.end()) {
            spdlog::info("Found replay {} ({} on {})", id, it->game_mode, it->map_name);
            return std::move(*it);
        }

        if (offset >= page->total) {
            break;
        }
        offset += DISCOVERY_PAGE_SIZE;
    }

    return std::unexpected(Error(ReplayErrc::not_found,
        "Recording " + std::string(id) + " not available (searched " + std::to_string(offset) + " entries)"));
}

std::expected<StartDownloadResponse, Error> ReplayClient::start_download(std::string_view id) {
    const std::string url = replay_url(id, "/startDownloading?user");
    auto response = post(url);
    if (!response) {
        return std::unexpected(response.error());
    }

    auto start = parse_start_download(response->text(), url);
    if (!start) {
        return std::unexpected(start.error());
    }
    if (start->state != RECORDED_STATE) {
        return std::unexpected(Error(ReplayErrc::precondition_failed,
            "Recording must be finished before download (state: '" + start->state + "')"));
    }
    if (start->num_chunks < 0) {
        return std::unexpected(Error(ReplayErrc::parse_error,
            url + ": negative numChunks " + std::to_string(start->num_chunks)));
    }
    return start;
}

std::expected<std::vector<format::Chunk>, Error>
ReplayClient::fetch_stream_chunks(std::string_view id, std::size_t count, ProgressPublisher& publisher) {
    auto chunks = fan_out<format::DataChunk>(count, config_.fetch_workers,
        [&](std::size_t i) -> std::expected<format::DataChunk, Error> {
            auto response = get(replay_url(id, "/file/stream." + std::to_string(i)));
            if (!response) {
                return std::unexpected(response.error());
            }

            format::DataChunk chunk;
            chunk.time1 = header_i32(*response, "mtime1");
            chunk.time2 = header_i32(*response, "mtime2");
            chunk.data = std::move(response->body);
            publisher.download_step();
            return chunk;
        });
    if (!chunks) {
        return std::unexpected(chunks.error());
    }

    std::vector<format::Chunk> out;
    out.reserve(chunks->size());
    for (auto& c : *chunks) {
        out.emplace_back(std::move(c));
    }
    return out;
}

std::expected<DownloadedReplay, Error>
ReplayClient::fetch_impl(std::string_view id, ProgressPublisher& publisher, bool write_step) {
    if (!is_valid_id(id)) {
        return std::unexpected(Error(ReplayErrc::invalid_input, "Invalid replay id '" + std::string(id) + "'"));
    }

    DownloadedReplay result;

    auto descriptor = find_replay(id);
    if (!descriptor) {
        return std::unexpected(descriptor.error());
    }
    result.descriptor = std::move(*descriptor);

    auto start = start_download(id);
    if (!start) {
        return std::unexpected(start.error());
    }
    const auto num_chunks = static_cast<std::size_t>(start->num_chunks);
    spdlog::info("Replay {} recorded with {} stream chunks", id, num_chunks);

    const std::string meta_url = endpoint("/meta/" + std::string(id));
    auto meta_response = get(meta_url);
    if (!meta_response) {
        return std::unexpected(meta_response.error());
    }
    auto meta = parse_meta_data(meta_response->text(), meta_url);
    if (!meta) {
        return std::unexpected(meta.error());
    }
    result.meta = std::move(*meta);

    const std::string checkpoint_url = replay_url(id, "/event?group=checkpoint");
    auto checkpoint_response = get(checkpoint_url);
    if (!checkpoint_response) {
        return std::unexpected(checkpoint_response.error());
    }
    auto checkpoint_events = parse_event_list(checkpoint_response->text(), checkpoint_url);
    if (!checkpoint_events) {
        return std::unexpected(checkpoint_events.error());
    }

    const std::string pavlov_url = replay_url(id, "/event?group=Pavlov");
    auto pavlov_response = get(pavlov_url);
    if (!pavlov_response) {
        return std::unexpected(pavlov_response.error());
    }
    auto pavlov_events = parse_event_list(pavlov_response->text(), pavlov_url);
    if (!pavlov_events) {
        return std::unexpected(pavlov_events.error());
    }

    publisher.download_total(1 + num_chunks);

    auto header = get(replay_url(id, "/file/replay.header"));
    if (!header) {
        return std::unexpected(header.error());
    }
    publisher.download_step();

    std::vector<format::Chunk> chunks;
    chunks.reserve(1 + num_chunks + checkpoint_events->events.size() + pavlov_events->events.size());
    chunks.emplace_back(format::HeaderChunk{std::move(header->body)});

    auto streams = fetch_stream_chunks(id, num_chunks, publisher);
    if (!streams) {
        return std::unexpected(streams.error());
    }
    spdlog::info("Fetched {} stream chunks for {}", streams->size(), id);
    for (auto& chunk : *streams) {
        chunks.push_back(std::move(chunk));
    }

    append_events(chunks, *checkpoint_events, format::ChunkType::checkpoint);
    append_events(chunks, *pavlov_events, format::ChunkType::event);

    const std::size_t build_max = chunks.size() + 1 + (write_step ? 1 : 0);
    publisher.build(0, build_max);

    auto bytes = build_replay(result.meta, std::move(chunks),
        [&](std::size_t done, std::size_t) { publisher.build(done, build_max); });
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    result.bytes = std::move(*bytes);
    return result;
}

std::expected<DownloadedReplay, Error>
ReplayClient::fetch(std::string_view id, const OnlineProgressCallback& progress) {
    ProgressPublisher publisher(progress);
    return fetch_impl(id, publisher, false);
}

std::expected<format::Bytes, Error>
ReplayClient::download(std::string_view id, const OnlineProgressCallback& progress) {
    auto replay = fetch(id, progress);
    if (!replay) {
        return std::unexpected(replay.error());
    }
    return std::move(replay->bytes);
}

std::expected<fs::path, Error>
ReplayClient::download_to(std::string_view id, const fs::path& directory, const OnlineProgressCallback& progress) {
    ProgressPublisher publisher(progress);
    auto replay = fetch_impl(id, publisher, true);
    if (!replay) {
        return std::unexpected(replay.error());
    }

    auto filename = replay_filename(replay->meta, id);
    if (!filename) {
        return std::unexpected(filename.error());
    }

    auto path = save_replay(directory, *filename, replay->bytes);
    if (!path) {
        return std::unexpected(path.error());
    }

    const auto build = publisher.snapshot().build;
    publisher.build(build.max, build.max);
    return path;
}

std::expected<format::Bytes, Error>
download_replay(std::string_view id, const OnlineProgressCallback& progress) {
    ReplayClient client;
    return client.download(id, progress);
}

} // namespace pavtv::core
