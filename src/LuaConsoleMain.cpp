//
//  LuaConsoleMain.cpp
//  LuaConsole Framework - Terminal Host
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  Drives a ReplConsole from a plain terminal: lines read from stdin are
//  submitted as if typed, records are printed as they are added, and
//  SIGINT is routed to the console's interrupt.
//

#include "include/LuaConsole.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using namespace LuaConsole;

// Global state for the main application
static std::atomic<bool> g_interrupt_requested{false};
static std::atomic<int> g_signal_count{0};

void signal_handler(int signal) {
    (void)signal;
    g_interrupt_requested = true;
    // A second Ctrl-C before the first one is handled terminates
    if (g_signal_count.fetch_add(1) >= 1) {
        std::_Exit(130);
    }
}

static void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --mode, -m <name>    Execution mode: inline, queued, threaded" << std::endl;
    std::cout << "  --tab-width <n>      Spaces per tab stop (default 4)" << std::endl;
    std::cout << "  --ctrl-d-exits       End of input closes the console" << std::endl;
    std::cout << "  --debug, -d          Enable diagnostic output" << std::endl;
    std::cout << "  --help, -h           Show this help message" << std::endl;
}

// Link between the stdin reader thread and the foreground loop
struct InputChannel {
    std::mutex mutex;
    bool open = true;
    std::atomic<bool> finished{false};
    CommandQueue* queue = nullptr;
    ReplConsole* console = nullptr;

    bool post(std::function<void()> command) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!open) {
            return false;
        }
        queue->deferVoidCommand(std::move(command));
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex);
        open = false;
        queue->shutdown();
    }
};

static void print_record(const LogRecord& record) {
    switch (record.domain) {
        case RecordDomain::Input: {
            // Only the first prompt line; the terminal echoes what is typed
            std::string head = record.prompt.substr(0, record.prompt.find('\n'));
            std::cout << head << std::flush;
            break;
        }
        case RecordDomain::Output:
            std::cout << record.prompt.substr(0, record.prompt.find('\n')) << record.text << std::flush;
            break;
        case RecordDomain::RawOutput:
        case RecordDomain::Control:
            std::cout << record.text << std::flush;
            break;
    }
}

int main(int argc, char* argv[]) {
    ConsoleConfig config = create_default_config();
    config.execution_mode = ExecutionMode::Threaded;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--debug" || arg == "-d") {
            config.enable_debug_logging = true;
        } else if (arg == "--ctrl-d-exits") {
            config.ctrl_d_exits = true;
        } else if ((arg == "--mode" || arg == "-m") && i + 1 < argc) {
            if (!parse_execution_mode(argv[++i], &config.execution_mode)) {
                std::cerr << "Unknown execution mode: " << argv[i] << std::endl;
                return 2;
            }
        } else if (arg == "--tab-width" && i + 1 < argc) {
            config.tab_width = std::atoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    if (config.execution_mode == ExecutionMode::External) {
        std::cerr << "External mode needs a host spawn function" << std::endl;
        return 2;
    }

    ReplConsole console(config);
    console.on_record([](const LogRecord& record, int) { print_record(record); });

    if (!console.initialize()) {
        std::cerr << "LuaConsoleMain: " << console.get_last_error() << std::endl;
        return 1;
    }
    console.set_completion_provider(std::make_shared<LuaCompletionProvider>(console.controller()));

    std::signal(SIGINT, signal_handler);

    // Reader thread: each terminal line is delivered to the foreground loop.
    // It only reaches the console through the shared channel, which main
    // closes before the console goes away.
    std::shared_ptr<InputChannel> channel = std::make_shared<InputChannel>();
    channel->queue = &console.foreground_queue();
    channel->console = &console;

    std::thread reader([channel]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!channel->post([channel, line]() {
                    channel->console->insert_input_text(line);
                    channel->console->submit_input();
                })) {
                return;
            }
        }
        channel->post([channel]() {
            ReplConsole* console = channel->console;
            if (!console->handle_eof_request() && !console->is_executing()) {
                console->exit();
            }
        });
        channel->finished = true;
    });
    // std::getline cannot be cancelled
    reader.detach();

    while (!console.is_closed()) {
        console.wait_for_events(std::chrono::milliseconds(50));

        if (g_interrupt_requested.exchange(false)) {
            g_signal_count = 0;
            std::cout << std::endl;
            console.interrupt();
        }

        // Input ended while idle with Ctrl-D exit disabled: nothing more can arrive
        if (channel->finished && !console.is_executing() && !console.foreground_queue().hasPendingCommands()) {
            console.exit();
        }
    }

    // The detached reader may still post; drop anything it sends from now on
    channel->close();
    std::cout << std::endl;
    return 0;
}
