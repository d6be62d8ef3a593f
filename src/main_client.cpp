/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: main_client.cpp

    Description:
        Entry point of the netspeed_client executable.

        $ ./netspeed_client --size 1000000 --tcp 2 --udp 1
        $ ./netspeed_client                 (asks for the three values)
        $ ./netspeed_client --size 4096 --tcp 1 --udp 0 --once

        If none of --size, --tcp, --udp is given the values are read from
        stdin, re-asking until the file size is positive and both counts
        are non-negative. Otherwise missing values keep their defaults
        (one TCP and one UDP connection); --size is then required.

    Signal Handling:
        The handler only sets shutdown_requested. A watcher thread turns
        that into ShutdownSignal::trigger(), which ends discovery within
        one poll interval. A running speed test finishes first.

    Exit Codes:
        0: clean shutdown, --once completed or --help
        1: invalid arguments, closed stdin or discovery socket failure

*******************************************************************************/

#include "client/client.h"
#include "common/logger.h"

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

using namespace netspeed;

std::atomic<bool> shutdown_requested(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested = true;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --size BYTES           Bytes to download per connection\n"
              << "  --tcp N                Number of TCP connections (default: 1)\n"
              << "  --udp N                Number of UDP connections (default: 1)\n"
              << "  --discovery-port PORT  Port to listen for offers (default: 13117)\n"
              << "  --log-level LEVEL      debug, info, warning or error (default: info)\n"
              << "  --once                 Exit after one speed test\n"
              << "  --help                 Show this help message\n";
}

// Digits only: " 5", "-5" and "+5" are all rejected
static bool parse_number(const std::string& text, uint64_t max, uint64_t& out) {
    auto value = parse_decimal(text);
    if (!value || *value > max) return false;
    out = *value;
    return true;
}

// Reads one line; false if stdin is closed
static bool prompt(const std::string& question, std::string& answer) {
    std::cout << question << std::flush;
    return static_cast<bool>(std::getline(std::cin, answer));
}

// Asks until all three values are valid
static bool read_interactive(ClientConfig& config) {
    while (true) {
        std::string size_text, tcp_text, udp_text;
        if (!prompt("Enter file size (in bytes): ", size_text) ||
            !prompt("Enter number of TCP connections: ", tcp_text) ||
            !prompt("Enter number of UDP connections: ", udp_text)) {
            return false;
        }

        uint64_t size = 0, tcp = 0, udp = 0;
        if (parse_number(size_text, UINT64_MAX, size) && size > 0 &&
            parse_number(tcp_text, 1024, tcp) &&
            parse_number(udp_text, 1024, udp)) {
            config.file_size = size;
            config.tcp_connections = static_cast<int>(tcp);
            config.udp_connections = static_cast<int>(udp);
            return true;
        }

        Logger::error("Invalid input, please try again.");
    }
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    ClientConfig config;
    LogLevel level = LogLevel::INFO;
    bool transfer_args = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        uint64_t value = 0;

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--size" && i + 1 < argc) {
            if (!parse_number(argv[++i], UINT64_MAX, value) || value == 0) {
                std::cerr << "Invalid file size: " << argv[i] << "\n";
                return 1;
            }
            config.file_size = value;
            transfer_args = true;
        }
        else if (arg == "--tcp" && i + 1 < argc) {
            if (!parse_number(argv[++i], 1024, value)) {
                std::cerr << "Invalid TCP connection count: " << argv[i] << "\n";
                return 1;
            }
            config.tcp_connections = static_cast<int>(value);
            transfer_args = true;
        }
        else if (arg == "--udp" && i + 1 < argc) {
            if (!parse_number(argv[++i], 1024, value)) {
                std::cerr << "Invalid UDP connection count: " << argv[i] << "\n";
                return 1;
            }
            config.udp_connections = static_cast<int>(value);
            transfer_args = true;
        }
        else if (arg == "--discovery-port" && i + 1 < argc) {
            if (!parse_number(argv[++i], 65535, value) || value == 0) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
            config.discovery_port = static_cast<uint16_t>(value);
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            if (!Logger::parse_level(argv[++i], level)) {
                std::cerr << "Invalid log level: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (arg == "--once") {
            config.once = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    Logger::set_level(level);
    Logger::set_color(isatty(STDOUT_FILENO) != 0);

    if (!transfer_args) {
        if (!read_interactive(config)) {
            Logger::error("No input, exiting");
            return 1;
        }
    } else if (config.file_size == 0) {
        std::cerr << "--size is required when --tcp or --udp is given\n";
        return 1;
    }

    ShutdownSignal shutdown;
    std::atomic<bool> finished(false);

    std::thread watcher([&shutdown, &finished]() {
        while (!finished) {
            if (shutdown_requested) {
                Logger::warning("Client shutting down by user request...");
                shutdown.trigger();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    SpeedTestClient client(config);
    int completed = client.run(shutdown);

    finished = true;
    watcher.join();

    if (completed == 0 && !shutdown.triggered()) {
        return 1;
    }
    return 0;
}
