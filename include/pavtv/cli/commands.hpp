// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace pavtv::cli {

// CLI result
using CliResult = std::expected<int, core::Error>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> ids;
    std::string output_dir;
    std::string server;
    std::string local_dir;
    std::int64_t list_offset{0};
    bool list{false};
    bool local{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string bad_option;   // First unrecognized option, if any
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Route spdlog to stderr at the level selected by -V/-q
void configure_logging(bool verbose, bool quiet);

// Download one replay into args.output_dir
[[nodiscard]] CliResult download(const std::string& id, const CliArgs& args);

// Print one discovery page
[[nodiscard]] CliResult list(const CliArgs& args);

// Build a replay from a local chunk directory
[[nodiscard]] CliResult process_local(const CliArgs& args);

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace pavtv::cli
