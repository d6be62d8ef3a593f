/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: tcp_download.cpp

*******************************************************************************/

#include "client/tcp_download.h"
#include "common/logger.h"
#include "common/message.h"
#include "common/socket_utils.h"

#include <sys/socket.h>
#include <netinet/in.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace netspeed {

// Reads until 'expected' bytes arrived, EOF, or an error/timeout
static uint64_t receive_stream(int fd, uint64_t expected, int index) {
    uint8_t buffer[TCP_RECEIVE_BUFFER_SIZE];
    uint64_t received = 0;

    while (received < expected) {
        size_t want = static_cast<size_t>(
            std::min<uint64_t>(sizeof(buffer), expected - received));
        ssize_t n = recv(fd, buffer, want, 0);

        if (n == 0) {
            if (received < expected) {
                Logger::warning("TCP transfer #" + std::to_string(index) +
                                ": server closed after " + std::to_string(received) +
                                "/" + std::to_string(expected) + " bytes");
            }
            break;
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                Logger::error("TCP transfer #" + std::to_string(index) + ": receive timed out");
            } else {
                Logger::error("TCP transfer #" + std::to_string(index) +
                              ": receive failed: " + std::string(strerror(errno)));
            }
            break;
        }

        received += static_cast<uint64_t>(n);
    }

    return received;
}

TransferResult run_tcp_transfer(const std::string& server_ip, uint16_t tcp_port,
                                uint64_t file_size, int index,
                                std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;

    TransferResult result;
    result.protocol = TransferProtocol::TCP;
    result.index = index;

    const Clock::time_point start = Clock::now();

    sockaddr_in server;
    if (!make_ipv4_address(server_ip, tcp_port, server)) {
        Logger::error("TCP transfer #" + std::to_string(index) +
                      ": invalid server address " + server_ip);
        return result;
    }

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        Logger::error("TCP transfer #" + std::to_string(index) +
                      ": socket failed: " + std::string(strerror(errno)));
        return result;
    }

    if (!connect_with_timeout(fd, server, timeout)) {
        Logger::error("TCP transfer #" + std::to_string(index) + ": failed to connect to " +
                      address_to_string(server) + ": " + std::string(strerror(errno)));
        close_socket(fd);
        result.duration_sec = floor_duration(
            std::chrono::duration<double>(Clock::now() - start).count());
        return result;
    }

    if (!set_io_timeouts(fd, timeout)) {
        Logger::warning("TCP transfer #" + std::to_string(index) +
                        ": failed to set socket timeouts: " + std::string(strerror(errno)));
    }

    const std::string request = format_size_line(file_size);
    if (!send_all(fd, reinterpret_cast<const uint8_t*>(request.data()), request.size())) {
        Logger::error("TCP transfer #" + std::to_string(index) +
                      ": failed to send request: " + std::string(strerror(errno)));
    } else {
        result.bytes_transferred = receive_stream(fd, file_size, index);
    }

    close_socket(fd);

    result.duration_sec = floor_duration(
        std::chrono::duration<double>(Clock::now() - start).count());
    return result;
}

} // namespace netspeed
