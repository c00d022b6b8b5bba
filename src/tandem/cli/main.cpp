// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/cli/commands.hpp>
#include <tandem/core/log.hpp>
#include <tandem/core/transfer_service.hpp>
#include <tandem/remote/curl_executor.hpp>
#include <exception>
#include <cstdlib>
#include <iostream>

using namespace tandem::cli;

// Report exceptions that escape into std::terminate
static void tandem_terminate_handler() {
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
            std::cerr << "Unknown exception" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(tandem_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.errors.empty()) {
        for (const auto& e : args.errors) {
            std::cerr << "Error: " << e << std::endl;
        }
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }
    if (args.remote_paths.empty()) {
        std::cerr << "Error: No remote path specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    tandem::core::init_logging(args.quiet ? "warn" : "info");

    auto config = build_config(args);
    if (!config) {
        return 1;
    }
    tandem::core::init_logging(args.quiet && !args.verbose ? "warn" : config->log_level);

    tandem::remote::CurlExecutor::global_init();

    int exit_code = 1;
    {
        auto service = tandem::core::TransferService::create(std::move(*config));
        if (!service) {
            std::cerr << "Error: " << service.error().message() << std::endl;
        } else {
            auto result = args.info_only
                ? info(**service, args.remote_paths)
                : download(**service, args.remote_paths, args.json, args.quiet);
            exit_code = result ? *result : 1;
        }
    } // Service and its jobs are gone before curl cleanup

    tandem::remote::CurlExecutor::global_cleanup();
    return exit_code;
}
