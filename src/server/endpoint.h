/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: endpoint.h

    Description:
        Server start-up networking: which local address to report, and the
        three sockets the server runs on.

        - discover_local_ip(): asks the kernel which interface would route
          to a public address (UDP connect, nothing is sent)
        - open_tcp_listener(): TCP data-plane listener on an OS-assigned port
        - open_udp_endpoint(): UDP data-plane socket on an OS-assigned port
        - open_broadcast_socket(): unbound UDP socket with SO_BROADCAST

    Ephemeral Ports:
        Binding to port 0 lets the kernel pick a free port; getsockname()
        reads it back. The bound socket IS the listener, so there is no
        window in which another process could grab the port between the
        lookup and the real bind.

    Error Handling:
        Functions return -1 and log an ERROR with strerror(errno). The
        caller (SpeedTestServer::start) aborts start-up.

*******************************************************************************/

#ifndef ENDPOINT_H
#define ENDPOINT_H

#include <cstdint>
#include <string>

namespace netspeed {

// Reported when the route lookup fails (no default route, offline host)
constexpr const char* FALLBACK_LOCAL_IP = "172.1.0.4";

std::string discover_local_ip(const std::string& probe_ip = "8.8.8.8",
                              uint16_t probe_port = 80);

// Returns the listening fd and stores the assigned port in 'port'
int open_tcp_listener(uint16_t& port, int backlog = 16);

// Returns the bound UDP fd and stores the assigned port in 'port'
int open_udp_endpoint(uint16_t& port);

int open_broadcast_socket();

} // namespace netspeed

#endif // ENDPOINT_H
