/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: main_server.cpp

    Description:
        Entry point of the netspeed_server executable. Parses the command
        line into a ServerConfig, starts SpeedTestServer and runs until
        SIGINT/SIGTERM.

    Command-Line Interface:
        $ ./netspeed_server
        (broadcasts to 255.255.255.255:13117, 1024-byte UDP segments,
         4096-byte TCP writes)

        $ ./netspeed_server --discovery-port 14000 --broadcast-address 10.0.0.255
        $ ./netspeed_server --log-level debug

    Signal Handling:
        SIGINT/SIGTERM only set shutdown_requested; the main loop notices
        it within 200 ms and calls stop(). SIGPIPE is ignored so a client
        that vanishes mid-stream surfaces as EPIPE from send().

    Exit Codes:
        0: clean shutdown or --help
        1: invalid arguments or start-up failure

*******************************************************************************/

#include "server/server.h"
#include "common/logger.h"

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
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
              << "  --discovery-port PORT      Offer broadcast port (default: 13117)\n"
              << "  --broadcast-address IP     Offer destination (default: 255.255.255.255)\n"
              << "  --udp-chunk-size BYTES     Payload bytes per UDP segment (default: 1024)\n"
              << "  --tcp-chunk-size BYTES     Bytes per TCP write (default: 4096)\n"
              << "  --log-level LEVEL          debug, info, warning or error (default: info)\n"
              << "  --help                     Show this help message\n";
}

// Digits only: " 5", "-5" and "+5" are all rejected
static bool parse_number(const std::string& text, uint64_t max, uint64_t& out) {
    auto value = parse_decimal(text);
    if (!value || *value > max) return false;
    out = *value;
    return true;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    ServerConfig config;
    LogLevel level = LogLevel::INFO;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        uint64_t value = 0;

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--discovery-port" && i + 1 < argc) {
            if (!parse_number(argv[++i], 65535, value) || value == 0) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
            config.discovery_port = static_cast<uint16_t>(value);
        }
        else if (arg == "--broadcast-address" && i + 1 < argc) {
            config.broadcast_address = argv[++i];
        }
        else if (arg == "--udp-chunk-size" && i + 1 < argc) {
            if (!parse_number(argv[++i], MAX_DATAGRAM_SIZE - PayloadMessage::HEADER_SIZE, value) ||
                value == 0) {
                std::cerr << "Invalid UDP chunk size: " << argv[i] << "\n";
                return 1;
            }
            config.udp_chunk_size = value;
        }
        else if (arg == "--tcp-chunk-size" && i + 1 < argc) {
            if (!parse_number(argv[++i], 1ULL << 24, value) || value == 0) {
                std::cerr << "Invalid TCP chunk size: " << argv[i] << "\n";
                return 1;
            }
            config.tcp_chunk_size = value;
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            if (!Logger::parse_level(argv[++i], level)) {
                std::cerr << "Invalid log level: " << argv[i] << "\n";
                return 1;
            }
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    Logger::set_level(level);
    Logger::set_color(isatty(STDOUT_FILENO) != 0);
    Logger::info("=== Network Speed Test Server ===");

    SpeedTestServer server(config);
    if (!server.start()) {
        Logger::error("Failed to start server");
        return 1;
    }

    Logger::info("Server running. Press Ctrl+C to stop.");

    while (!shutdown_requested && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Logger::warning("Server shutting down...");
    server.stop();
    server.print_statistics();
    return 0;
}
