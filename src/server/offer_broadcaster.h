/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: offer_broadcaster.h

    Description:
        Periodically announces the server on the LAN. Every interval one
        9-byte OfferMessage carrying the server's UDP and TCP data ports is
        sent to broadcast_address:discovery_port.

    Failure Policy:
        Broadcasting is best effort. A failed sendto() (no broadcast route,
        interface down, ENOBUFS) is logged as a warning and the next tick
        simply tries again. Only the shutdown signal ends the loop.

    Lifecycle:
        OfferBroadcaster b(...);
        if (!b.init()) { ...abort start-up... }   // creates the socket
        std::thread t(&OfferBroadcaster::run, &b, std::ref(shutdown));

*******************************************************************************/

#ifndef OFFER_BROADCASTER_H
#define OFFER_BROADCASTER_H

#include "common/shutdown_signal.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <netinet/in.h>

namespace netspeed {

class OfferBroadcaster {
public:
    OfferBroadcaster(const std::string& broadcast_address,
                     uint16_t discovery_port,
                     uint16_t udp_port,
                     uint16_t tcp_port,
                     std::chrono::milliseconds interval);
    ~OfferBroadcaster();

    OfferBroadcaster(const OfferBroadcaster&) = delete;
    OfferBroadcaster& operator=(const OfferBroadcaster&) = delete;

    // Resolves the target and opens the SO_BROADCAST socket
    bool init();

    // One tick: send a single offer. False if sendto() failed.
    bool send_offer();

    // Ticks every interval until 'shutdown' fires
    void run(ShutdownSignal& shutdown);

    uint64_t offers_sent() const { return offers_sent_; }
    uint64_t send_failures() const { return send_failures_; }

private:
    std::string broadcast_address_;
    uint16_t discovery_port_;
    std::chrono::milliseconds interval_;

    int fd_;
    sockaddr_in target_;
    std::vector<uint8_t> packet_;   // the offer never changes, encode once

    std::atomic<uint64_t> offers_sent_;
    std::atomic<uint64_t> send_failures_;
};

} // namespace netspeed

#endif // OFFER_BROADCASTER_H
