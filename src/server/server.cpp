/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: server.cpp

    Description:
        Implementation of SpeedTestServer: start-up, the two request loops,
        handler dispatch and shutdown.

*******************************************************************************/

#include "server/server.h"
#include "server/endpoint.h"
#include "server/tcp_session.h"
#include "server/udp_session.h"
#include "common/logger.h"
#include "common/socket_utils.h"
#include "common/transfer_stats.h"

#include <cerrno>
#include <cstring>
#include <exception>
#include <functional>
#include <sstream>
#include <vector>

namespace netspeed {

//==============================================================================
// SECTION 1: CONSTRUCTION
//==============================================================================

SpeedTestServer::SpeedTestServer(const ServerConfig& config)
    : config_(config),
      running_(false),
      tcp_fd_(-1),
      udp_fd_(-1),
      tcp_port_(0),
      udp_port_(0),
      stats_(std::make_shared<ServerStats>()) {}

SpeedTestServer::~SpeedTestServer() {
    stop();
}

//==============================================================================
// SECTION 2: LIFECYCLE
//==============================================================================
//
// STARTUP SEQUENCE:
// 1. Resolve the address to print
// 2. Bind TCP listener and UDP endpoint to OS-assigned ports
// 3. Prepare the broadcaster with those ports
// 4. Spawn broadcast, TCP accept and UDP request threads
//
// Any failure before step 4 closes what was opened and returns false.
//

bool SpeedTestServer::start() {
    if (running_) {
        Logger::warning("Server already running");
        return false;
    }

    server_ip_ = discover_local_ip();

    tcp_fd_ = open_tcp_listener(tcp_port_);
    if (tcp_fd_ < 0) {
        Logger::error("Failed to open TCP listener");
        return false;
    }

    udp_fd_ = open_udp_endpoint(udp_port_);
    if (udp_fd_ < 0) {
        Logger::error("Failed to open UDP endpoint");
        close_endpoints();
        return false;
    }

    broadcaster_ = std::make_unique<OfferBroadcaster>(config_.broadcast_address,
                                                      config_.discovery_port,
                                                      udp_port_, tcp_port_,
                                                      config_.broadcast_interval);
    if (!broadcaster_->init()) {
        Logger::error("Failed to set up offer broadcast");
        broadcaster_.reset();
        close_endpoints();
        return false;
    }

    shutdown_.reset();
    running_ = true;

    broadcast_thread_ = std::thread(&OfferBroadcaster::run, broadcaster_.get(),
                                    std::ref(shutdown_));
    tcp_thread_ = std::thread(&SpeedTestServer::tcp_accept_loop, this);
    udp_thread_ = std::thread(&SpeedTestServer::udp_request_loop, this);

    Logger::info("Server started, listening on IP address " + server_ip_ +
                 " (TCP port " + std::to_string(tcp_port_) +
                 ", UDP port " + std::to_string(udp_port_) + ")");
    return true;
}

// Listening sockets are closed only after the loops have been joined, so
// a loop never polls a descriptor number that was already reused.
void SpeedTestServer::stop() {
    if (!running_) return;

    Logger::info("Stopping server...");
    running_ = false;
    shutdown_.trigger();

    if (broadcast_thread_.joinable()) broadcast_thread_.join();
    if (tcp_thread_.joinable()) tcp_thread_.join();
    if (udp_thread_.joinable()) udp_thread_.join();

    // broadcaster_ is kept so its counters stay readable after stop
    close_endpoints();

    Logger::info("Server stopped");
}

void SpeedTestServer::close_endpoints() {
    close_socket(tcp_fd_);
    tcp_fd_ = -1;
    close_socket(udp_fd_);
    udp_fd_ = -1;
}

uint64_t SpeedTestServer::offers_sent() const {
    return broadcaster_ ? broadcaster_->offers_sent() : 0;
}

//==============================================================================
// SECTION 3: TCP ACCEPT LOOP
//==============================================================================

void SpeedTestServer::tcp_accept_loop() {
    const size_t chunk_size = config_.tcp_chunk_size;
    const std::chrono::milliseconds io_timeout = config_.tcp_io_timeout;

    while (!shutdown_.triggered()) {
        sockaddr_in peer;
        RecvStatus status = RecvStatus::TIMEOUT;
        int client_fd = accept_connection(tcp_fd_, config_.poll_interval, peer, status);

        if (status == RecvStatus::TIMEOUT) continue;
        if (client_fd < 0) {
            if (!shutdown_.triggered()) {
                Logger::error("Accept failed: " + std::string(strerror(errno)));
            }
            continue;
        }

        Logger::debug("Accepted TCP connection from " + address_to_string(peer));

        std::shared_ptr<ServerStats> stats = stats_;
        std::thread([client_fd, peer, chunk_size, io_timeout, stats]() {
            try {
                TcpServeOutcome outcome = serve_tcp_client(client_fd, peer,
                                                           chunk_size, io_timeout);
                stats->tcp_bytes_sent += outcome.stream.bytes_sent;
                if (outcome.status == TcpServeStatus::COMPLETED) {
                    stats->tcp_transfers++;
                } else if (outcome.status != TcpServeStatus::CLIENT_CLOSED) {
                    stats->tcp_errors++;
                }
            } catch (const std::exception& e) {
                stats->tcp_errors++;
                Logger::error("TCP handler failed: " + std::string(e.what()));
            }
        }).detach();
    }

    Logger::debug("TCP accept loop stopped");
}

//==============================================================================
// SECTION 4: UDP REQUEST LOOP
//==============================================================================

void SpeedTestServer::udp_request_loop() {
    const size_t chunk_size = config_.udp_chunk_size;
    std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);

    while (!shutdown_.triggered()) {
        sockaddr_in from;
        size_t received = 0;
        RecvStatus status = receive_datagram(udp_fd_, buffer.data(), buffer.size(),
                                             config_.poll_interval, received, &from);

        if (status == RecvStatus::TIMEOUT) continue;
        if (status != RecvStatus::DATA) {
            if (!shutdown_.triggered()) {
                Logger::error("UDP receive failed: " + std::string(strerror(errno)));
            }
            continue;
        }

        auto request = RequestMessage::deserialize(buffer.data(), received);
        if (!request) {
            stats_->invalid_datagrams++;
            Logger::debug("Ignoring invalid datagram from " + address_to_string(from));
            continue;
        }

        const uint64_t file_size = request->file_size;
        std::shared_ptr<ServerStats> stats = stats_;
        std::thread([from, file_size, chunk_size, stats]() {
            try {
                uint64_t sent = serve_udp_request(from, file_size, chunk_size);
                stats->udp_segments_sent += sent;
                stats->udp_transfers++;
                if (sent < total_segments_for(file_size, chunk_size)) {
                    stats->udp_errors++;
                }
            } catch (const std::exception& e) {
                stats->udp_errors++;
                Logger::error("UDP handler failed: " + std::string(e.what()));
            }
        }).detach();
    }

    Logger::debug("UDP request loop stopped");
}

//==============================================================================
// SECTION 5: STATISTICS
//==============================================================================

void SpeedTestServer::print_statistics() const {
    std::stringstream ss;
    ss << "\n=== Server Statistics ===\n"
       << "Offers Broadcast: " << offers_sent() << "\n"
       << "TCP Transfers: " << stats_->tcp_transfers.load() << "\n"
       << "TCP Bytes Sent: " << stats_->tcp_bytes_sent.load() << "\n"
       << "TCP Errors: " << stats_->tcp_errors.load() << "\n"
       << "UDP Transfers: " << stats_->udp_transfers.load() << "\n"
       << "UDP Segments Sent: " << stats_->udp_segments_sent.load() << "\n"
       << "UDP Errors: " << stats_->udp_errors.load() << "\n"
       << "Invalid Datagrams: " << stats_->invalid_datagrams.load() << "\n"
       << "=========================\n";

    Logger::info(ss.str());
}

} // namespace netspeed
