/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: test_discovery.cpp

    Description:
        Tests for offer discovery. Offers are sent to 127.0.0.1 on a free
        port instead of broadcast, so the tests run on hosts without a
        broadcast route and never disturb a real server on 13117.

*******************************************************************************/

#include "client/offer_listener.h"
#include "server/offer_broadcaster.h"
#include "server/endpoint.h"
#include "common/message.h"
#include "common/shutdown_signal.h"
#include "common/socket_utils.h"
#include "common/logger.h"

#include <sys/socket.h>

#include <iostream>
#include <cassert>
#include <chrono>
#include <functional>
#include <thread>
#include <vector>

using namespace netspeed;

using Clock = std::chrono::steady_clock;

// A UDP port nothing is bound to right now
static uint16_t free_udp_port() {
    uint16_t port = 0;
    int fd = open_udp_endpoint(port);
    close_socket(fd);
    return port;
}

static void send_to_loopback(uint16_t port, const std::vector<uint8_t>& bytes) {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    sockaddr_in target;
    make_ipv4_address("127.0.0.1", port, target);
    sendto(fd, bytes.data(), bytes.size(), 0, (struct sockaddr*)&target, sizeof(target));
    close_socket(fd);
}

static double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

int main() {
    Logger::set_level(LogLevel::WARNING);
    Logger::info("Running Discovery tests...");

    int passed = 0;
    int failed = 0;

    const std::chrono::milliseconds poll(100);

    {
        std::cout << "Test 1: Listener returns the first offer... ";
        try {
            uint16_t port = free_udp_port();
            OfferListener listener(port, poll);
            assert(listener.open());

            std::thread sender([port]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                send_to_loopback(port, OfferMessage(4001, 4002).serialize());
            });

            Clock::time_point start = Clock::now();
            auto offer = listener.listen_for_offer(std::chrono::milliseconds(3000));
            sender.join();

            assert(offer);
            assert(offer->server_ip == "127.0.0.1");
            assert(offer->udp_port == 4001);
            assert(offer->tcp_port == 4002);
            assert(seconds_since(start) < 2.0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Foreign datagrams are skipped... ";
        try {
            uint16_t port = free_udp_port();
            OfferListener listener(port, poll);
            assert(listener.open());

            std::thread sender([port]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));

                std::vector<uint8_t> bad_cookie = OfferMessage(1, 1).serialize();
                bad_cookie[3] = 0x00;
                send_to_loopback(port, bad_cookie);
                send_to_loopback(port, RequestMessage(10).serialize());
                send_to_loopback(port, std::vector<uint8_t>{'h', 'i'});
                send_to_loopback(port, OfferMessage(5001, 5002).serialize());
            });

            auto offer = listener.listen_for_offer(std::chrono::milliseconds(3000));
            sender.join();

            assert(offer);
            assert(offer->udp_port == 5001);
            assert(offer->tcp_port == 5002);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: No server means nullopt at the deadline... ";
        try {
            OfferListener listener(free_udp_port(), poll);

            Clock::time_point start = Clock::now();
            auto offer = listener.listen_for_offer(std::chrono::milliseconds(300));
            double elapsed = seconds_since(start);

            assert(!offer);
            assert(elapsed >= 0.29);
            assert(elapsed < 2.0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Shutdown ends discovery early... ";
        try {
            OfferListener listener(free_udp_port(), poll);
            ShutdownSignal shutdown;

            std::thread stopper([&shutdown]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(150));
                shutdown.trigger();
            });

            Clock::time_point start = Clock::now();
            auto offer = listener.listen_for_offer(std::chrono::milliseconds(10000), &shutdown);
            stopper.join();

            assert(!offer);
            assert(seconds_since(start) < 2.0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Broadcaster offers reach a listener... ";
        try {
            uint16_t port = free_udp_port();
            OfferListener listener(port, poll);
            assert(listener.open());

            OfferBroadcaster broadcaster("127.0.0.1", port, 6001, 6002,
                                         std::chrono::milliseconds(100));
            assert(broadcaster.init());

            ShutdownSignal shutdown;
            std::thread loop(&OfferBroadcaster::run, &broadcaster, std::ref(shutdown));

            auto offer = listener.listen_for_offer(std::chrono::milliseconds(3000));

            Clock::time_point stop_start = Clock::now();
            shutdown.trigger();
            loop.join();

            assert(offer);
            assert(offer->udp_port == 6001);
            assert(offer->tcp_port == 6002);
            assert(broadcaster.offers_sent() >= 1);
            assert(seconds_since(stop_start) < 1.0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Several listeners share a discovery port... ";
        try {
            uint16_t port = free_udp_port();
            OfferListener first(port, poll);
            OfferListener second(port, poll);
            assert(first.open());
            assert(second.open());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: Invalid broadcast address fails init... ";
        try {
            OfferBroadcaster broadcaster("not-an-ip", 13117, 1, 2, std::chrono::milliseconds(100));
            assert(!broadcaster.init());

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
