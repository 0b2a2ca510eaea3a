// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/cli/commands.hpp>

#include <csignal>
#include <ctime>
#include <exception>
#include <iostream>
#include <stop_token>
#include <thread>

#include <pthread.h>

using namespace patchsync::cli;

namespace {

// SIGINT/SIGTERM are delivered to the watcher only. Call before any other
// thread starts so every worker inherits the blocked mask.
sigset_t block_cancel_signals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    return signals;
}

int run_sync(const CliArgs& args) {
    const sigset_t signals = block_cancel_signals();

    std::stop_source cancel;
    std::jthread watcher([&signals, &cancel](std::stop_token stop) {
        const timespec poll{0, 200'000'000};  // 200 ms
        while (!stop.stop_requested()) {
            const int sig = sigtimedwait(&signals, nullptr, &poll);
            if (sig == SIGINT || sig == SIGTERM) {
                std::cerr << "\nCancelling, partial downloads are kept for the next run..." << std::endl;
                cancel.request_stop();
                return;
            }
        }
    });

    auto result = sync(args, cancel.get_token());
    watcher.request_stop();
    return result.value_or(EXIT_RUN_ERROR);
}

} // namespace

int main(int argc, char* argv[]) {
    const CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return EXIT_SYNC_OK;
    }
    if (args.version) {
        print_version();
        return EXIT_SYNC_OK;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\nTry '" << argv[0] << " --help'" << std::endl;
        return EXIT_RUN_ERROR;
    }

    try {
        switch (args.command) {
            case Command::sync:
                return run_sync(args);
            case Command::generate:
                return generate(args.folder, args.output_file).value_or(EXIT_RUN_ERROR);
            case Command::none:
                break;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_RUN_ERROR;
    }

    std::cerr << "Error: no command given\nTry '" << argv[0] << " --help'" << std::endl;
    return EXIT_RUN_ERROR;
}
