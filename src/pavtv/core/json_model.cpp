// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/core/json_model.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <limits>
#include <optional>
#include <utility>
#include <stdexcept>
#include <string>

namespace pavtv::core {

using json = nlohmann::json;

namespace {

// Document parsed but does not have the expected shape
struct SchemaError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

template<typename T>
std::optional<T> optional_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->template get<T>();
}

template<typename T>
T field_or(const json& j, const char* key, T fallback) {
    auto value = optional_field<T>(j, key);
    return value ? std::move(*value) : std::move(fallback);
}

const json& required(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw SchemaError(std::string("missing field '") + key + "'");
    }
    return *it;
}

// Integer field that must fit T exactly
template<typename T>
T integer_value(const json& v, const char* key) {
    if (!v.is_number_integer()) {
        throw SchemaError(std::string("field '") + key + "' must be an integer");
    }
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (std::in_range<T>(u)) return static_cast<T>(u);
    } else {
        const auto s = v.get<std::int64_t>();
        if (std::in_range<T>(s)) return static_cast<T>(s);
    }
    throw SchemaError(std::string("field '") + key + "' is out of range: " + v.dump());
}

template<typename T>
std::optional<T> optional_integer(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return integer_value<T>(*it, key);
}

// Array of integers in [0, 255]
std::vector<std::uint8_t> byte_array(const json& v, const char* key) {
    if (!v.is_array()) {
        throw SchemaError(std::string("field '") + key + "' must be an array");
    }
    std::vector<std::uint8_t> bytes;
    bytes.reserve(v.size());
    for (const auto& b : v) {
        bytes.push_back(integer_value<std::uint8_t>(b, key));
    }
    return bytes;
}

// Accepts a string or an integer and yields its text
std::string text_value(const json& v, const char* key) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_unsigned()) return std::to_string(v.get<std::uint64_t>());
    if (v.is_number_integer()) return std::to_string(v.get<std::int64_t>());
    throw SchemaError(std::string("field '") + key + "' must be a string or an integer");
}

void expect_object(const json& j, const char* what) {
    if (!j.is_object()) {
        throw SchemaError(std::string(what) + " must be a JSON object");
    }
}

ReplayDescriptor descriptor_from_json(const json& j) {
    expect_object(j, "replay entry");

    ReplayDescriptor r;
    r.id = text_value(required(j, "_id"), "_id");
    r.game_mode = field_or<std::string>(j, "gameMode", {});
    r.map_name = field_or<std::string>(j, "friendlyName", {});
    r.shack = field_or(j, "shack", false);
    r.created = field_or<std::string>(j, "created", {});
    r.expires = field_or<std::string>(j, "expires", {});
    r.seconds_since = optional_integer<std::int32_t>(j, "secondsSince").value_or(0);
    r.workshop_mods = field_or<std::string>(j, "workshop_mods", {});
    r.competitive = field_or(j, "competitive", false);
    r.live = field_or(j, "live", false);
    r.users = field_or<std::vector<std::string>>(j, "users", {});
    r.mod_count = optional_integer<std::int32_t>(j, "modcount").value_or(0);
    return r;
}

MetaData meta_from_json(const json& j) {
    expect_object(j, "meta");

    MetaData m;
    m.game_mode = required(j, "gameMode").get<std::string>();
    m.friendly_name = required(j, "friendlyName").get<std::string>();
    m.competitive = required(j, "competitive").get<bool>();
    m.workshop_mods = required(j, "workshop_mods").get<std::string>();
    m.live = required(j, "live").get<bool>();
    m.total_time = integer_value<std::int32_t>(required(j, "totalTime"), "totalTime");
    m.version = integer_value<std::int32_t>(required(j, "__v"), "__v");
    m.created = text_value(required(j, "created"), "created");
    return m;
}

Event event_from_json(const json& j) {
    expect_object(j, "event");

    Event e;
    e.id = optional_field<std::string>(j, "id");
    e.group = optional_field<std::string>(j, "group");
    e.meta = optional_field<std::string>(j, "meta");
    e.time1 = optional_integer<std::int32_t>(j, "time1");
    e.time2 = optional_integer<std::int32_t>(j, "time2");

    auto data = j.find("data");
    if (data != j.end() && data->is_object()) {
        EventData d;
        d.type = optional_field<std::string>(*data, "type");
        if (auto bytes = data->find("data"); bytes != data->end() && !bytes->is_null()) {
            d.data = byte_array(*bytes, "data");
        }
        e.data = std::move(d);
    }
    return e;
}

EventList event_list_from_json(const json& j) {
    expect_object(j, "event list");

    EventList list;
    const auto& events = required(j, "events");
    if (!events.is_array()) {
        throw SchemaError("field 'events' must be an array");
    }
    list.events.reserve(events.size());
    for (const auto& e : events) {
        list.events.push_back(event_from_json(e));
    }
    return list;
}

template<typename T, typename Convert>
std::expected<T, Error> parse_document(std::string_view text, std::string_view source, Convert&& convert) {
    try {
        const json j = json::parse(text);
        return convert(j);
    } catch (const json::exception& e) {
        return std::unexpected(Error(ReplayErrc::parse_error, std::string(source) + ": " + e.what()));
    } catch (const SchemaError& e) {
        return std::unexpected(Error(ReplayErrc::parse_error, std::string(source) + ": " + e.what()));
    }
}

} // namespace

std::expected<ReplayPage, Error>
parse_replay_page(std::string_view json_text, std::string_view source) {
    return parse_document<ReplayPage>(json_text, source, [](const json& j) {
        expect_object(j, "find response");

        ReplayPage page;
        const auto& replays = required(j, "replays");
        if (!replays.is_array()) {
            throw SchemaError("field 'replays' must be an array");
        }
        page.replays.reserve(replays.size());
        for (const auto& r : replays) {
            page.replays.push_back(descriptor_from_json(r));
        }
        page.total = integer_value<std::int64_t>(required(j, "total"), "total");
        return page;
    });
}

std::expected<StartDownloadResponse, Error>
parse_start_download(std::string_view json_text, std::string_view source) {
    return parse_document<StartDownloadResponse>(json_text, source, [&](const json& j) {
        expect_object(j, "startDownloading response");

        StartDownloadResponse resp;
        resp.state = field_or<std::string>(j, "state", {});

        auto num = j.find("numChunks");
        if (num != j.end() && num->is_number_integer()) {
            resp.num_chunks = integer_value<std::int64_t>(*num, "numChunks");
        } else {
            spdlog::warn("{}: no integer 'numChunks', assuming 0 stream chunks", source);
        }
        return resp;
    });
}

std::expected<MetaData, Error>
parse_meta_data(std::string_view json_text, std::string_view source) {
    return parse_document<MetaData>(json_text, source, meta_from_json);
}

std::expected<EventList, Error>
parse_event_list(std::string_view json_text, std::string_view source) {
    return parse_document<EventList>(json_text, source, event_list_from_json);
}

std::expected<std::vector<TimingEntry>, Error>
parse_timing(std::string_view json_text, std::string_view source) {
    return parse_document<std::vector<TimingEntry>>(json_text, source, [](const json& j) {
        if (!j.is_array()) {
            throw SchemaError("timing data must be a JSON array");
        }

        std::vector<TimingEntry> entries;
        entries.reserve(j.size());
        for (const auto& e : j) {
            expect_object(e, "timing entry");
            entries.push_back(TimingEntry{
                text_value(required(e, "numchunks"), "numchunks"),
                text_value(required(e, "mtime1"), "mtime1"),
                text_value(required(e, "mtime2"), "mtime2"),
            });
        }
        return entries;
    });
}

std::expected<LocalMetadataFile, Error>
parse_local_metadata(std::string_view json_text, std::string_view source) {
    return parse_document<LocalMetadataFile>(json_text, source, [](const json& j) {
        expect_object(j, "metadata file");

        LocalMetadataFile file;
        if (auto it = j.find("meta"); it != j.end() && !it->is_null()) {
            file.meta = meta_from_json(*it);
        }
        if (auto it = j.find("events"); it != j.end() && !it->is_null()) {
            file.events = event_list_from_json(*it);
        }
        if (auto it = j.find("events_pavlov"); it != j.end() && !it->is_null()) {
            file.events_pavlov = event_list_from_json(*it);
        }
        return file;
    });
}

} // namespace pavtv::core
