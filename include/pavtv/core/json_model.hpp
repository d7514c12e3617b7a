// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/core/error.hpp>
#include <pavtv/core/models.hpp>
#include <expected>
#include <string_view>
#include <vector>

namespace pavtv::core {

// All parsers report malformed JSON or an unexpected schema as parse_error.
// `source` names the document (URL or file) in the error detail.

[[nodiscard]] std::expected<ReplayPage, Error>
parse_replay_page(std::string_view json, std::string_view source = "find");

[[nodiscard]] std::expected<StartDownloadResponse, Error>
parse_start_download(std::string_view json, std::string_view source = "startDownloading");

[[nodiscard]] std::expected<MetaData, Error>
parse_meta_data(std::string_view json, std::string_view source = "meta");

[[nodiscard]] std::expected<EventList, Error>
parse_event_list(std::string_view json, std::string_view source = "event");

[[nodiscard]] std::expected<std::vector<TimingEntry>, Error>
parse_timing(std::string_view json, std::string_view source = "timing.json");

[[nodiscard]] std::expected<LocalMetadataFile, Error>
parse_local_metadata(std::string_view json, std::string_view source = "metadata.json");

} // namespace pavtv::core
