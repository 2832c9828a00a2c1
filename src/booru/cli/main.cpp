// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/cli/app_config.hpp>
#include <booru/cli/commands.hpp>
#include <booru/core/http_session.hpp>
#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <pthread.h>
#include <exception>
#include <iostream>
#include <stop_token>
#include <thread>

using namespace booru::cli;

// Terminate handler to report exceptions that escape a thread
static void booru_terminate_handler() {
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

// Turns SIGINT into a stop request. SIGINT must already be blocked in every
// thread so that only sigtimedwait() here sees it.
static void watch_interrupt(std::stop_token self, std::stop_source run) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    const timespec poll{0, 200'000'000};

    while (!self.stop_requested()) {
        if (sigtimedwait(&set, nullptr, &poll) == SIGINT) {
            std::cout << "\nCtrl-C received, exiting..." << std::endl;
            run.request_stop();
            return;
        }
    }
}

int main(int argc, char* argv[]) {
    std::set_terminate(booru_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return exit_ok;
    }
    if (args.version) {
        print_version();
        return exit_ok;
    }
    if (args.print_config) {
        std::cout << DEFAULT_CONFIG_STR;
        return exit_ok;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return exit_failure;
    }

    setup_logging(args.verbose, args.quiet);

    auto config = resolve_config(args);
    if (!config) {
        spdlog::error("{}", config.error().message());
        return exit_failure;
    }

    // Block SIGINT before any worker thread exists; they inherit the mask
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    booru::core::HttpSession::global_init();

    std::stop_source interrupt;
    int code = exit_failure;
    {
        std::jthread watcher(watch_interrupt, interrupt);
        try {
            code = run(*config, args.quiet, interrupt.get_token());
        } catch (const std::exception& e) {
            spdlog::critical("{}", e.what());
            code = exit_failure;
        }
    }

    booru::core::HttpSession::global_cleanup();
    return interrupt.stop_requested() ? exit_interrupted : code;
}
