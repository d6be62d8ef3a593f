/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: server.h

    Description:
        SpeedTestServer ties the server side together: it opens the data
        plane sockets, advertises them on the LAN and serves every TCP
        connection and every UDP Request it receives.

    Architecture:

        ┌──────────────────────────────────────────────────────┐
        │                  SPEEDTEST SERVER                    │
        │                                                      │
        │  broadcast thread ──► Offer every 1 s ──► :13117     │
        │                                                      │
        │  tcp accept thread ─► accept (0.5 s poll)            │
        │        └─► detached handler: serve_tcp_client()      │
        │                                                      │
        │  udp request thread ► recvfrom (0.5 s poll)          │
        │        └─► detached handler: serve_udp_request()     │
        └──────────────────────────────────────────────────────┘

    Concurrency Model:
        Three long-lived threads owned by the server and joined in stop().
        One detached thread per accepted connection or validated Request.
        Handlers get copies of what they need (fd, peer, size, chunk size)
        and a shared_ptr to the atomic counters; they never touch the
        server object, so stop() does not wait for them and a handler
        may outlive the server.

    Lifecycle:
        SpeedTestServer server(config);
        if (!server.start()) return 1;    // constructor never fails
        ...
        server.stop();                    // idempotent, destructor calls it

*******************************************************************************/

#ifndef SPEEDTEST_SERVER_H
#define SPEEDTEST_SERVER_H

#include "common/message.h"
#include "common/shutdown_signal.h"
#include "server/offer_broadcaster.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace netspeed {

//==============================================================================
// CONFIGURATION
//==============================================================================

struct ServerConfig {
    uint16_t discovery_port;
    std::string broadcast_address;
    std::chrono::milliseconds broadcast_interval;
    std::chrono::milliseconds poll_interval;      // accept / recvfrom wait
    size_t udp_chunk_size;
    size_t tcp_chunk_size;
    std::chrono::milliseconds tcp_io_timeout;

    ServerConfig()
        : discovery_port(DEFAULT_DISCOVERY_PORT),
          broadcast_address(DEFAULT_BROADCAST_ADDRESS),
          broadcast_interval(1000),
          poll_interval(500),
          udp_chunk_size(DEFAULT_UDP_CHUNK_SIZE),
          tcp_chunk_size(DEFAULT_TCP_CHUNK_SIZE),
          tcp_io_timeout(5000) {}
};

//==============================================================================
// STATISTICS
//==============================================================================
//
// Updated by handler threads, read by print_statistics() and tests.
//

struct ServerStats {
    std::atomic<uint64_t> tcp_transfers{0};       // streams fully sent
    std::atomic<uint64_t> tcp_bytes_sent{0};
    std::atomic<uint64_t> tcp_errors{0};          // malformed, recv or send failures
    std::atomic<uint64_t> udp_transfers{0};       // requests served
    std::atomic<uint64_t> udp_segments_sent{0};
    std::atomic<uint64_t> udp_errors{0};          // transfers cut short
    std::atomic<uint64_t> invalid_datagrams{0};   // not a Request, ignored
};

//==============================================================================
// SERVER
//==============================================================================

class SpeedTestServer {
public:
    explicit SpeedTestServer(const ServerConfig& config);
    ~SpeedTestServer();

    SpeedTestServer(const SpeedTestServer&) = delete;
    SpeedTestServer& operator=(const SpeedTestServer&) = delete;

    bool start();
    void stop();

    bool is_running() const { return running_; }

    // Valid after a successful start()
    uint16_t tcp_port() const { return tcp_port_; }
    uint16_t udp_port() const { return udp_port_; }
    const std::string& server_ip() const { return server_ip_; }

    std::shared_ptr<const ServerStats> stats() const { return stats_; }
    uint64_t offers_sent() const;

    void print_statistics() const;

private:
    void tcp_accept_loop();
    void udp_request_loop();
    void close_endpoints();

    ServerConfig config_;
    std::atomic<bool> running_;
    ShutdownSignal shutdown_;

    std::string server_ip_;
    int tcp_fd_;
    int udp_fd_;
    uint16_t tcp_port_;
    uint16_t udp_port_;

    std::unique_ptr<OfferBroadcaster> broadcaster_;
    std::shared_ptr<ServerStats> stats_;

    std::thread broadcast_thread_;
    std::thread tcp_thread_;
    std::thread udp_thread_;
};

} // namespace netspeed

#endif // SPEEDTEST_SERVER_H
