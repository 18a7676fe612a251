// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/commands.hpp>
#include <ferry/version.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace ferry::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void ferry_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto ex = std::current_exception()) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(ferry_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }
    if (args.ids.empty()) {
        std::cerr << "Error: No URL or ID specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }
    if (args.ids.size() > 1 && !args.output_file.empty()) {
        std::cerr << "Error: -o cannot be used with more than one download" << std::endl;
        return 2;
    }

    auto config = build_config(args);
    if (!config) {
        std::cerr << "Error: " << config.error().message() << std::endl;
        return 2;
    }
    configure_logging(*config, args.verbose, args.quiet);

    if (args.list_only) {
        for (const auto& id : args.ids) {
            auto result = info(id, *config);
            if (!result) {
                return 1;
            }
        }
        return 0;
    }

    install_signal_handlers();

    int exit_code = 0;
    for (const auto& id : args.ids) {
        if (stop_requested) break;

        auto result = download(id, args.output_file, *config, args.quiet);
        if (!result) {
            exit_code = 1;
        }
    }

    return exit_code;
}
