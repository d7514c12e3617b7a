// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pavtv::core {

// One row of the discovery listing
struct ReplayDescriptor {
    std::string id;
    std::string game_mode;
    std::string map_name;      // "friendlyName" on the wire
    bool shack{false};
    std::string created;
    std::string expires;
    std::int32_t seconds_since{0};
    std::string workshop_mods;
    bool competitive{false};
    bool live{false};
    std::vector<std::string> users;
    std::int32_t mod_count{0};
};

// One discovery page
struct ReplayPage {
    std::vector<ReplayDescriptor> replays;
    std::int64_t total{0};
};

// Session metadata encoded into the meta record
struct MetaData {
    std::string game_mode;
    std::string friendly_name;
    bool competitive{false};
    std::string workshop_mods;
    bool live{false};
    std::int32_t total_time{0};
    std::int32_t version{0};
    std::string created;       // RFC3339 or Unix seconds
};

struct EventData {
    std::optional<std::string> type;
    std::optional<std::vector<std::uint8_t>> data;
};

struct Event {
    std::optional<std::string> id;
    std::optional<std::string> group;
    std::optional<std::string> meta;
    std::optional<std::int32_t> time1;
    std::optional<std::int32_t> time2;
    std::optional<EventData> data;
};

struct EventList {
    std::vector<Event> events;
};

// Response of the start-downloading handshake
struct StartDownloadResponse {
    std::string state;
    std::int64_t num_chunks{0};
};

// timing.json entry; all fields are strings on disk
struct TimingEntry {
    std::string numchunks;
    std::string mtime1;
    std::string mtime2;
};

// metadata.json of a local chunk directory
struct LocalMetadataFile {
    std::optional<MetaData> meta;
    std::optional<EventList> events;
    std::optional<EventList> events_pavlov;
};

} // namespace pavtv::core
