// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/core/config.hpp>
#include <pavtv/core/error.hpp>
#include <pavtv/core/http_session.hpp>
#include <pavtv/core/models.hpp>
#include <pavtv/core/progress.hpp>
#include <pavtv/core/retry.hpp>
#include <pavtv/format/chunk.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace pavtv::core {

// Everything a download produced, before persistence
struct DownloadedReplay {
    ReplayDescriptor descriptor;
    MetaData meta;
    format::Bytes bytes;
};

// Serializes progress snapshots from the download workers to one callback
class ProgressPublisher {
public:
    explicit ProgressPublisher(OnlineProgressCallback callback) : callback_(std::move(callback)) {}

    void download_total(std::size_t max);
    void download_step();
    void build(std::size_t current, std::size_t max);

    [[nodiscard]] OnlineProgress snapshot() const;

private:
    void publish_locked();

    OnlineProgressCallback callback_;
    OnlineProgress state_;
    mutable std::mutex mutex_;
};

// Finds a replay on the discovery service, downloads its parts and assembles
// the container. Holds no state between calls.
class ReplayClient {
public:
    explicit ReplayClient(ClientConfig config = {});
    ReplayClient(ClientConfig config, std::shared_ptr<HttpTransport> transport, SleepFn sleep = {});

    // IDs are restricted to ASCII letters and digits
    [[nodiscard]] static bool is_valid_id(std::string_view id) noexcept;

    // One discovery page starting at `offset`
    [[nodiscard]] std::expected<ReplayPage, Error> list_replays(std::int64_t offset = 0);

    // Walk discovery pages until `id` is found or the listing is exhausted
    [[nodiscard]] std::expected<ReplayDescriptor, Error> find_replay(std::string_view id);

    // Full pipeline, returning the assembled container and its metadata
    [[nodiscard]] std::expected<DownloadedReplay, Error>
    fetch(std::string_view id, const OnlineProgressCallback& progress = {});

    // Full pipeline, returning only the container bytes
    [[nodiscard]] std::expected<format::Bytes, Error>
    download(std::string_view id, const OnlineProgressCallback& progress = {});

    // Full pipeline, then write "{name}-{mode}-{date}({id}).replay" into `directory`
    [[nodiscard]] std::expected<std::filesystem::path, Error>
    download_to(std::string_view id,
                const std::filesystem::path& directory,
                const OnlineProgressCallback& progress = {});

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::expected<DownloadedReplay, Error>
    fetch_impl(std::string_view id, ProgressPublisher& publisher, bool write_step);

    [[nodiscard]] std::expected<HttpResponse, Error> get(const std::string& url);
    [[nodiscard]] std::expected<HttpResponse, Error> post(const std::string& url);

    [[nodiscard]] std::expected<StartDownloadResponse, Error> start_download(std::string_view id);

    [[nodiscard]] std::expected<std::vector<format::Chunk>, Error>
    fetch_stream_chunks(std::string_view id, std::size_t count, ProgressPublisher& publisher);

    [[nodiscard]] std::string endpoint(std::string_view path) const;
    [[nodiscard]] std::string replay_url(std::string_view id, std::string_view tail) const;

    ClientConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    SleepFn sleep_;
};

// Download one replay with a default-configured client
[[nodiscard]] std::expected<format::Bytes, Error>
download_replay(std::string_view id, const OnlineProgressCallback& progress = {});

} // namespace pavtv::core
