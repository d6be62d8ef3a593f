/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: endpoint.cpp

    Description:
        Implementation of the server start-up socket helpers.

*******************************************************************************/

#include "server/endpoint.h"
#include "common/logger.h"
#include "common/socket_utils.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace netspeed {

//==============================================================================
// SECTION 1: LOCAL ADDRESS DISCOVERY
//==============================================================================
//
// connect() on a UDP socket only selects a route and a source address, no
// packet leaves the host. getsockname() then reports that source address.
//

std::string discover_local_ip(const std::string& probe_ip, uint16_t probe_port) {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        Logger::warning("Local IP lookup: socket failed: " + std::string(strerror(errno)));
        return FALLBACK_LOCAL_IP;
    }

    std::string result = FALLBACK_LOCAL_IP;

    sockaddr_in probe;
    if (!make_ipv4_address(probe_ip, probe_port, probe)) {
        Logger::warning("Local IP lookup: invalid probe address " + probe_ip);
    } else if (connect(fd, (struct sockaddr*)&probe, sizeof(probe)) < 0) {
        Logger::debug("Local IP lookup: no route to " + probe_ip + ": " +
                      std::string(strerror(errno)));
    } else {
        sockaddr_in local;
        socklen_t len = sizeof(local);
        std::memset(&local, 0, sizeof(local));
        if (getsockname(fd, (struct sockaddr*)&local, &len) == 0) {
            result = ip_to_string(local);
        }
    }

    close(fd);
    return result;
}

//==============================================================================
// SECTION 2: DATA-PLANE SOCKETS
//==============================================================================

// Binds 'fd' to 0.0.0.0:0 and reads back the assigned port
static bool bind_ephemeral(int fd, uint16_t& port) {
    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(0);

    if (bind(fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
        Logger::error("Failed to bind socket: " + std::string(strerror(errno)));
        return false;
    }

    port = local_port(fd);
    if (port == 0) {
        Logger::error("Failed to read assigned port: " + std::string(strerror(errno)));
        return false;
    }
    return true;
}

int open_tcp_listener(uint16_t& port, int backlog) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        Logger::error("Failed to create TCP socket: " + std::string(strerror(errno)));
        return -1;
    }

    if (!bind_ephemeral(fd, port)) {
        close(fd);
        return -1;
    }

    if (listen(fd, backlog) < 0) {
        Logger::error("Failed to listen: " + std::string(strerror(errno)));
        close(fd);
        return -1;
    }

    Logger::debug("TCP listener bound to port " + std::to_string(port));
    return fd;
}

int open_udp_endpoint(uint16_t& port) {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        Logger::error("Failed to create UDP socket: " + std::string(strerror(errno)));
        return -1;
    }

    if (!bind_ephemeral(fd, port)) {
        close(fd);
        return -1;
    }

    Logger::debug("UDP endpoint bound to port " + std::to_string(port));
    return fd;
}

int open_broadcast_socket() {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        Logger::error("Failed to create broadcast socket: " + std::string(strerror(errno)));
        return -1;
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &opt, sizeof(opt)) < 0) {
        Logger::error("Failed to set SO_BROADCAST: " + std::string(strerror(errno)));
        close(fd);
        return -1;
    }
    return fd;
}

} // namespace netspeed
