// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/cli/commands.hpp>
#include <steady/core/http_session.hpp>
#include <steady/core/log.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace steady::cli;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_interrupt(int) {
    g_interrupted = 1;
}

// Curl handles are process-wide; pair init with cleanup
struct CurlGlobal {
    CurlGlobal() { steady::core::HttpSession::global_init(); }
    ~CurlGlobal() { steady::core::HttpSession::global_cleanup(); }
};

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }
    if (args.version) {
        print_version();
        return EXIT_OK;
    }
    if (!args.errors.empty()) {
        for (const auto& err : args.errors) {
            std::cerr << "Error: " << err << std::endl;
        }
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_USAGE;
    }

    if (args.verbose) {
        steady::core::set_log_level(spdlog::level::debug);
    } else if (args.quiet) {
        steady::core::set_log_level(spdlog::level::err);
    } else {
        steady::core::set_log_level(spdlog::level::warn);
    }

    auto config = resolve_config(args);
    if (!config) {
        std::cerr << "Error: cannot use config " << args.config_file << ": "
                  << config.error().message() << std::endl;
        return EXIT_USAGE;
    }

    CurlGlobal curl_global;
    steady::core::HttpSession session(*config);

    // Ctrl-C turns into a cooperative stop request
    std::stop_source stop;
    std::signal(SIGINT, on_interrupt);
    std::jthread watcher([&stop](std::stop_token self) {
        using namespace std::chrono_literals;
        while (!self.stop_requested()) {
            if (g_interrupted) {
                stop.request_stop();
                return;
            }
            std::this_thread::sleep_for(50ms);
        }
    });

    int rc = args.info ? info(session, args.url, stop.get_token())
                       : download(session, args, *config, stop.get_token());

    watcher.request_stop();
    return rc;
}
