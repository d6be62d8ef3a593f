/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: udp_download.cpp

*******************************************************************************/

#include "client/udp_download.h"
#include "common/logger.h"
#include "common/message.h"
#include "common/socket_utils.h"

#include <sys/socket.h>
#include <netinet/in.h>

#include <cerrno>
#include <cstring>
#include <vector>

namespace netspeed {

static int open_receive_socket() {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) return -1;

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(0);

    if (bind(fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
        int saved = errno;
        close_socket(fd);
        errno = saved;
        return -1;
    }
    return fd;
}

TransferResult run_udp_transfer(const std::string& server_ip, uint16_t udp_port,
                                uint64_t file_size, int index,
                                std::chrono::milliseconds quiet_period) {
    using Clock = UdpReceiveTracker::Clock;

    const std::string label = "UDP transfer #" + std::to_string(index);

    sockaddr_in server;
    if (!make_ipv4_address(server_ip, udp_port, server)) {
        Logger::error(label + ": invalid server address " + server_ip);
        TransferResult empty;
        empty.protocol = TransferProtocol::UDP;
        empty.index = index;
        return empty;
    }

    int fd = open_receive_socket();
    if (fd < 0) {
        Logger::error(label + ": failed to open socket: " + std::string(strerror(errno)));
        TransferResult empty;
        empty.protocol = TransferProtocol::UDP;
        empty.index = index;
        return empty;
    }

    const Clock::time_point start = Clock::now();
    UdpReceiveTracker tracker(start);

    const std::vector<uint8_t> request = RequestMessage(file_size).serialize();
    ssize_t sent = sendto(fd, request.data(), request.size(), 0,
                          (struct sockaddr*)&server, sizeof(server));
    if (sent != static_cast<ssize_t>(request.size())) {
        Logger::error(label + ": failed to send request: " +
                      (sent < 0 ? std::string(strerror(errno)) : std::string("short write")));
        close_socket(fd);
        return tracker.finish(index, Clock::now());
    }

    std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);

    while (true) {
        Clock::duration left = tracker.remaining_quiet(Clock::now(), quiet_period);
        if (left <= Clock::duration::zero()) break;

        // Round up so a sub-millisecond remainder still waits once
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(left);
        if (wait < left) wait += std::chrono::milliseconds(1);

        size_t received = 0;
        RecvStatus status = receive_datagram(fd, buffer.data(), buffer.size(),
                                             wait, received, nullptr);
        if (status == RecvStatus::DATA) {
            tracker.on_datagram(buffer.data(), received, Clock::now());
        } else if (status == RecvStatus::ERROR) {
            Logger::error(label + ": receive failed: " + std::string(strerror(errno)));
            break;
        }
    }

    close_socket(fd);

    Logger::debug(label + ": " + std::to_string(tracker.segments_received()) + "/" +
                  std::to_string(tracker.total_segments()) + " segments");
    return tracker.finish(index, Clock::now());
}

} // namespace netspeed
