/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: offer_listener.h

    Description:
        Client-side discovery. Listens on the discovery port for the first
        valid OfferMessage and reports who sent it and which data ports it
        advertises.

        The socket uses SO_REUSEADDR and SO_REUSEPORT so several clients on
        one host can listen on the same discovery port, and SO_BROADCAST so
        broadcast datagrams are delivered.

        Datagrams that are not a valid Offer (wrong cookie, wrong type,
        short) are skipped silently.

*******************************************************************************/

#ifndef OFFER_LISTENER_H
#define OFFER_LISTENER_H

#include "common/shutdown_signal.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace netspeed {

struct ServerOffer {
    std::string server_ip;
    uint16_t udp_port;
    uint16_t tcp_port;

    ServerOffer() : udp_port(0), tcp_port(0) {}
};

class OfferListener {
public:
    explicit OfferListener(uint16_t discovery_port,
                           std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));
    ~OfferListener();

    OfferListener(const OfferListener&) = delete;
    OfferListener& operator=(const OfferListener&) = delete;

    // Opens and binds the socket. False (logged) on failure.
    bool open();

    // First valid offer before 'deadline' expires, or nullopt on timeout
    // or when 'shutdown' fires.
    std::optional<ServerOffer> listen_for_offer(std::chrono::milliseconds deadline,
                                                ShutdownSignal* shutdown = nullptr);

    uint16_t port() const { return port_; }

private:
    uint16_t port_;
    std::chrono::milliseconds poll_interval_;
    int fd_;
};

} // namespace netspeed

#endif // OFFER_LISTENER_H
