// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/cli/commands.hpp>
#include <pavtv/core/http_session.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace pavtv::cli;

// Terminate handler reporting the active exception
static void pavtv_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

static int report(const CliResult& result) {
    if (!result) {
        std::cerr << "Error: " << result.error().message() << std::endl;
        return 1;
    }
    return *result;
}

int main(int argc, char* argv[]) {
    std::set_terminate(pavtv_terminate_handler);
    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    // Handle help
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    // Handle version
    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.bad_option.empty()) {
        std::cerr << "Error: " << args.bad_option << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    configure_logging(args.verbose, args.quiet);

    // Local mode needs no network
    if (args.local) {
        return report(process_local(args));
    }

    if (!args.list && args.ids.empty()) {
        std::cerr << "Error: No replay ID specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    pavtv::core::HttpSession::global_init();

    int exit_code = 0;
    if (args.list) {
        exit_code = report(list(args));
    }

    for (const auto& id : args.ids) {
        if (report(download(id, args)) != 0) {
            exit_code = 1;
        }
    }

    pavtv::core::HttpSession::global_cleanup();
    return exit_code;
}
