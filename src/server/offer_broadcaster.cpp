/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: offer_broadcaster.cpp

*******************************************************************************/

#include "server/offer_broadcaster.h"
#include "server/endpoint.h"
#include "common/message.h"
#include "common/logger.h"
#include "common/socket_utils.h"

#include <sys/socket.h>

#include <cerrno>
#include <cstring>

namespace netspeed {

OfferBroadcaster::OfferBroadcaster(const std::string& broadcast_address,
                                   uint16_t discovery_port,
                                   uint16_t udp_port,
                                   uint16_t tcp_port,
                                   std::chrono::milliseconds interval)
    : broadcast_address_(broadcast_address),
      discovery_port_(discovery_port),
      interval_(interval),
      fd_(-1),
      offers_sent_(0),
      send_failures_(0) {
    std::memset(&target_, 0, sizeof(target_));
    packet_ = OfferMessage(udp_port, tcp_port).serialize();
}

OfferBroadcaster::~OfferBroadcaster() {
    close_socket(fd_);
}

bool OfferBroadcaster::init() {
    if (!make_ipv4_address(broadcast_address_, discovery_port_, target_)) {
        Logger::error("Invalid broadcast address: " + broadcast_address_);
        return false;
    }

    fd_ = open_broadcast_socket();
    return fd_ >= 0;
}

bool OfferBroadcaster::send_offer() {
    ssize_t sent = sendto(fd_, packet_.data(), packet_.size(), 0,
                          (struct sockaddr*)&target_, sizeof(target_));
    if (sent != static_cast<ssize_t>(packet_.size())) {
        send_failures_++;
        Logger::warning("Broadcast error: " +
                        (sent < 0 ? std::string(strerror(errno)) : std::string("short write")));
        return false;
    }

    offers_sent_++;
    return true;
}

void OfferBroadcaster::run(ShutdownSignal& shutdown) {
    Logger::info("Broadcasting offers to " + broadcast_address_ + ":" +
                 std::to_string(discovery_port_) + " every " +
                 std::to_string(interval_.count()) + " ms");

    while (!shutdown.triggered()) {
        send_offer();

        // Wakes early on shutdown
        if (shutdown.wait_for(interval_)) break;
    }

    Logger::debug("Offer broadcast loop stopped after " +
                  std::to_string(offers_sent_.load()) + " offers");
}

} // namespace netspeed
