// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/core/config.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/transfer_engine.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace reel::cli;
using namespace reel::core;

// Terminate handler to catch exceptions in noexcept functions
static void reel_terminate_handler() {
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
    std::set_terminate(reel_terminate_handler);
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

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }

    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(args.verbose ? spdlog::level::debug
                      : args.quiet ? spdlog::level::warn
                                   : spdlog::level::info);

    // Session: config file, then environment, then flags
    SessionConfig session;
    if (!args.config_file.empty()) {
        auto loaded = SessionConfig::load(args.config_file);
        if (!loaded) {
            std::cerr << "Error: Cannot load config " << args.config_file << ": "
                      << loaded.error().message() << std::endl;
            return 1;
        }
        session = std::move(*loaded);
    }
    session.apply_environment();
    if (args.sample_bytes) session.sample_bytes = *args.sample_bytes;
    if (args.retries) session.max_retries = *args.retries;

    if (args.urls.empty() && args.manifest.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    HttpSession::global_init();
    int exit_code = 0;
    {
        HttpSession transport;

        if (args.info) {
            for (const auto& url : args.urls) {
                auto result = info(transport, session, url, args.referer);
                if (!result) exit_code = 1;
            }
        } else {
            auto tasks = build_tasks(args, session);
            if (!tasks) {
                std::cerr << "Error: " << tasks.error().message() << std::endl;
                exit_code = 1;
            } else {
                if (session.sample_bytes > 0) {
                    spdlog::info("Sample mode: first {} bytes of each file", session.sample_bytes);
                }

                TransferEngine engine(transport, session);
                auto summary = run_batch(engine, *tasks, session, !args.quiet);
                print_summary(summary);
                exit_code = summary.failed > 0 ? 1 : 0;
            }
        }
    }
    HttpSession::global_cleanup();

    return exit_code;
}
