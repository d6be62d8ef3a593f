/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: offer_listener.cpp

*******************************************************************************/

#include "client/offer_listener.h"
#include "common/logger.h"
#include "common/message.h"
#include "common/socket_utils.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace netspeed {

OfferListener::OfferListener(uint16_t discovery_port,
                             std::chrono::milliseconds poll_interval)
    : port_(discovery_port), poll_interval_(poll_interval), fd_(-1) {}

OfferListener::~OfferListener() {
    close_socket(fd_);
}

bool OfferListener::open() {
    if (fd_ >= 0) return true;

    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        Logger::error("Failed to create discovery socket: " + std::string(strerror(errno)));
        return false;
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0 ||
        setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt)) < 0 ||
        setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &opt, sizeof(opt)) < 0) {
        Logger::error("Failed to set discovery socket options: " +
                      std::string(strerror(errno)));
        close(fd);
        return false;
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(port_);

    if (bind(fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
        Logger::error("Failed to bind discovery port " + std::to_string(port_) +
                      ": " + std::string(strerror(errno)));
        close(fd);
        return false;
    }

    fd_ = fd;
    return true;
}

std::optional<ServerOffer> OfferListener::listen_for_offer(std::chrono::milliseconds deadline,
                                                           ShutdownSignal* shutdown) {
    using Clock = std::chrono::steady_clock;

    if (!open()) return std::nullopt;

    const Clock::time_point end = Clock::now() + deadline;
    uint8_t buffer[1024];

    while (true) {
        if (shutdown && shutdown->triggered()) return std::nullopt;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(end - Clock::now());
        if (left <= std::chrono::milliseconds::zero()) return std::nullopt;

        sockaddr_in from;
        size_t received = 0;
        RecvStatus status = receive_datagram(fd_, buffer, sizeof(buffer),
                                             std::min(left, poll_interval_),
                                             received, &from);
        if (status == RecvStatus::TIMEOUT) continue;
        if (status != RecvStatus::DATA) {
            Logger::error("Discovery receive failed: " + std::string(strerror(errno)));
            return std::nullopt;
        }

        auto offer = OfferMessage::deserialize(buffer, received);
        if (!offer) continue;

        ServerOffer result;
        result.server_ip = ip_to_string(from);
        result.udp_port = offer->udp_port;
        result.tcp_port = offer->tcp_port;

        Logger::info("Received offer from " + result.server_ip +
                     " (TCP port " + std::to_string(result.tcp_port) +
                     ", UDP port " + std::to_string(result.udp_port) + ")");
        return result;
    }
}

} // namespace netspeed
