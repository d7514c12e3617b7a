// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/cli/commands.hpp>
#include <pavtv/cli/progress_bar.hpp>
#include <pavtv/core/http_session.hpp>
#include <pavtv/core/local_processor.hpp>
#include <pavtv/core/replay_client.hpp>
#include <pavtv/version.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <charconv>
#include <filesystem>
#include <iostream>

using namespace pavtv::core;

namespace fs = std::filesystem;

namespace pavtv::cli {

namespace {

bool parse_offset(std::string_view text, std::int64_t& out) noexcept {
    std::int64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value < 0) {
        return false;
    }
    out = value;
    return true;
}

ClientConfig client_config(const CliArgs& args) {
    ClientConfig config;
    if (!args.server.empty()) {
        config.server = args.server;
    }
    return config;
}

std::string yes_no(bool value) {
    return value ? "yes" : "no";
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto take_value = [&](int& i, std::string& out, const std::string& opt) {
        if (i + 1 < argc) {
            out = argv[++i];
        } else if (args.bad_option.empty()) {
            args.bad_option = opt + " requires a value";
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-d" || arg == "--directory") {
            take_value(i, args.output_dir, arg);
        } else if (arg == "-s" || arg == "--server") {
            take_value(i, args.server, arg);
        } else if (arg == "-p" || arg == "--process") {
            args.local = true;
            // Defaults to <executable dir>/replay_chunks
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                args.local_dir = argv[++i];
            }
        } else if (arg == "-l" || arg == "--list") {
            args.list = true;
            // Optional numeric offset
            if (i + 1 < argc && parse_offset(argv[i + 1], args.list_offset)) {
                ++i;
            }
        } else if (arg.starts_with("-") && arg.size() > 1) {
            if (args.bad_option.empty()) {
                args.bad_option = "Unknown option " + arg;
            }
        } else {
            args.ids.push_back(arg);
        }
    }

    return args;
}

void configure_logging(bool verbose, bool quiet) {
    auto logger = spdlog::get("pavtv");
    if (!logger) {
        logger = spdlog::stderr_color_mt("pavtv");
    }
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const std::string& id, const CliArgs& args) {
    ReplayClient client(client_config(args));

    const fs::path directory = args.output_dir.empty() ? fs::path(".") : fs::path(args.output_dir);

    ProgressBar bar("Downloading");
    OnlineProgressCallback callback;
    if (!args.quiet) {
        callback = [&](const OnlineProgress& p) {
            if (p.build.max > 0) {
                if (bar.label() != "Building") {
                    bar.finish();
                    bar = ProgressBar("Building");
                }
                bar.update(p.build.current, p.build.max);
            } else {
                bar.update(p.download.current, p.download.max);
            }
        };
    }

    spdlog::debug("Downloading {} from {}", id, client.config().server);

    auto path = client.download_to(id, directory, callback);
    if (!path) {
        if (!args.quiet) bar.clear();
        return std::unexpected(path.error());
    }

    if (!args.quiet) bar.finish();

    std::error_code ec;
    const auto size = fs::file_size(*path, ec);
    std::cout << "Saved " << path->string();
    if (!ec) {
        std::cout << " (" << ProgressBar::format_bytes(size) << ")";
    }
    std::cout << std::endl;
    return 0;
}

CliResult list(const CliArgs& args) {
    ReplayClient client(client_config(args));

    auto page = client.list_replays(args.list_offset);
    if (!page) {
        return std::unexpected(page.error());
    }

    std::cout << "Replays " << args.list_offset << "-"
              << args.list_offset + static_cast<std::int64_t>(page->replays.size())
              << " of " << page->total << "\n";
    std::cout << "\n";

    for (const auto& replay : page->replays) {
        std::cout << replay.id << "  " << replay.game_mode << "  " << replay.map_name << "\n";
        std::cout << "    Created: " << replay.created
                  << "  Competitive: " << yes_no(replay.competitive)
                  << "  Live: " << yes_no(replay.live)
                  << "  Players: " << replay.users.size() << "\n";
        if (!replay.workshop_mods.empty()) {
            std::cout << "    Mods: " << replay.workshop_mods << "\n";
        }
    }
    std::cout << std::flush;
    return 0;
}

CliResult process_local(const CliArgs& args) {
    const fs::path chunk_dir = args.local_dir.empty() ? default_chunks_dir() : fs::path(args.local_dir);
    const fs::path out_dir = args.output_dir.empty() ? fs::path(".") : fs::path(args.output_dir);

    ProgressBar bar("Processing");

    LocalConfig config;
    if (!args.quiet) {
        config.callback = [&](const LocalProgress& p) {
            const std::uint64_t current = p.header.current + p.data_chunks.current
                + p.event_chunks.current + p.checkpoint_chunks.current;
            const std::uint64_t total = p.header.max + p.data_chunks.max
                + p.event_chunks.max + p.checkpoint_chunks.max;
            bar.update(current, total);
        };
    }

    spdlog::info("Processing chunks from {}", chunk_dir.string());

    auto path = process_local_to(config, chunk_dir, out_dir);
    if (!path) {
        if (!args.quiet) bar.clear();
        return std::unexpected(path.error());
    }

    if (!args.quiet) bar.finish();
    std::cout << "Saved " << path->string() << std::endl;
    return 0;
}

void print_help(std::string_view program_name) {
    std::cout << "pavtv " << pavtv::version.to_string() << " - Pavlov TV replay downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <ID>...\n";
    std::cout << "  " << program_name << " -l [OFFSET]\n";
    std::cout << "  " << program_name << " -p [CHUNK_DIR]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar, warnings only)\n";
    std::cout << "  -d, --directory <DIR>   Save replays to specified directory\n";
    std::cout << "  -s, --server <URL>      Replay server (default: " << DEFAULT_SERVER << ")\n";
    std::cout << "  -l, --list [OFFSET]     List one page of available replays\n";
    std::cout << "  -p, --process [DIR]     Build a replay from local chunk files\n";
    std::cout << "                          (default: <executable dir>/replay_chunks)\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -l\n";
    std::cout << "  " << program_name << " -d replays 5f3a9c0e1b2d\n";
    std::cout << "  " << program_name << " -p ./replay_chunks\n";
}

void print_version() {
    std::cout << "pavtv " << pavtv::version.to_string() << std::endl;
    std::cout << "Built " << pavtv::BUILD_DATE << " with C++23, libcurl, nlohmann-json, spdlog\n";
}

} // namespace pavtv::cli
