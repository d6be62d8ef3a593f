/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: test_end_to_end.cpp

    Description:
        Runs a real SpeedTestServer and SpeedTestClient in one process.

        The server "broadcasts" to 127.0.0.1 on a free port so the test
        does not need a broadcast route and does not collide with a server
        already running on 13117. Timeouts are shortened so the whole file
        finishes in a few seconds.

    Test Workflow:
        1. Start the server, check its ports
        2. Client discovers it and runs one round (--once behavior)
        3. Client runs a 2 TCP + 1 UDP round, results are checked
        4. Server statistics reflect the served transfers
        5. Server stops promptly

*******************************************************************************/

#include "server/server.h"
#include "server/endpoint.h"
#include "client/client.h"
#include "common/shutdown_signal.h"
#include "common/socket_utils.h"
#include "common/logger.h"

#include <iostream>
#include <cassert>
#include <chrono>
#include <thread>

using namespace netspeed;

int main() {
    Logger::set_level(LogLevel::WARNING);
    Logger::info("Running End-to-End tests...");

    int passed = 0;
    int failed = 0;

    uint16_t discovery_port = 0;
    {
        int fd = open_udp_endpoint(discovery_port);
        close_socket(fd);
    }

    ServerConfig server_config;
    server_config.discovery_port = discovery_port;
    server_config.broadcast_address = "127.0.0.1";
    server_config.broadcast_interval = std::chrono::milliseconds(200);
    server_config.poll_interval = std::chrono::milliseconds(100);

    ClientConfig client_config;
    client_config.discovery_port = discovery_port;
    client_config.file_size = 20000;
    client_config.tcp_connections = 1;
    client_config.udp_connections = 1;
    client_config.discovery_deadline = std::chrono::milliseconds(3000);
    client_config.poll_interval = std::chrono::milliseconds(100);
    client_config.quiet_period = std::chrono::milliseconds(300);
    client_config.once = true;

    SpeedTestServer server(server_config);

    {
        std::cout << "Test 1: Server starts on OS-assigned ports... ";
        try {
            assert(server.start());
            assert(server.is_running());
            assert(server.tcp_port() != 0);
            assert(server.udp_port() != 0);
            assert(!server.server_ip().empty());

            // Second start is refused
            assert(!server.start());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Client discovers the server and completes a round... ";
        try {
            SpeedTestClient client(client_config);
            ShutdownSignal shutdown;

            int completed = client.run(shutdown);
            assert(completed == 1);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Concurrent TCP and UDP transfers... ";
        try {
            ClientConfig config = client_config;
            config.tcp_connections = 2;
            config.udp_connections = 1;
            SpeedTestClient client(config);

            ServerOffer offer;
            offer.server_ip = "127.0.0.1";
            offer.tcp_port = server.tcp_port();
            offer.udp_port = server.udp_port();

            std::vector<TransferResult> results = client.run_speed_test(offer);
            assert(results.size() == 3);

            assert(results[0].protocol == TransferProtocol::TCP && results[0].index == 1);
            assert(results[1].protocol == TransferProtocol::TCP && results[1].index == 2);
            assert(results[2].protocol == TransferProtocol::UDP && results[2].index == 1);

            assert(results[0].bytes_transferred == 20000);
            assert(results[1].bytes_transferred == 20000);

            const TransferResult& udp = results[2];
            assert(udp.segments_expected == 20);     // 20000 / 1024 rounded up
            assert(udp.segments_received > 0);
            assert(udp.segments_received <= udp.segments_expected);
            assert(udp.success_rate() > 0.0 && udp.success_rate() <= 100.0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Zero connections returns no results... ";
        try {
            ClientConfig config = client_config;
            config.tcp_connections = 0;
            config.udp_connections = 0;
            SpeedTestClient client(config);

            ServerOffer offer;
            offer.server_ip = "127.0.0.1";
            offer.tcp_port = server.tcp_port();
            offer.udp_port = server.udp_port();

            assert(client.run_speed_test(offer).empty());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Server statistics and shutdown... ";
        try {
            // Handlers are detached; give the last ones time to record
            std::this_thread::sleep_for(std::chrono::milliseconds(300));

            auto stats = server.stats();
            assert(stats->tcp_transfers >= 3);
            assert(stats->tcp_bytes_sent >= 60000);
            assert(stats->udp_transfers >= 2);
            assert(stats->udp_segments_sent >= 40);
            assert(server.offers_sent() >= 1);

            auto start = std::chrono::steady_clock::now();
            server.stop();
            double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start).count();

            assert(!server.is_running());
            assert(elapsed < 2.0);
            server.print_statistics();

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
