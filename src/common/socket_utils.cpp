/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: socket_utils.cpp

    Description:
        Implementation of the socket helpers declared in socket_utils.h.

*******************************************************************************/

#include "common/socket_utils.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace netspeed {

const char* recv_status_name(RecvStatus status) {
    switch (status) {
        case RecvStatus::DATA:
            return "DATA";
        case RecvStatus::TIMEOUT:
            return "TIMEOUT";
        case RecvStatus::CLOSED:
            return "CLOSED";
        case RecvStatus::ERROR:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

//==============================================================================
// SECTION 1: BOUNDED WAITS
//==============================================================================

RecvStatus wait_readable(int fd, std::chrono::milliseconds timeout) {
    if (fd < 0) {
        errno = EBADF;
        return RecvStatus::ERROR;
    }

    int timeout_ms = static_cast<int>(timeout.count());
    if (timeout_ms < 0) timeout_ms = 0;

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready == 0) return RecvStatus::TIMEOUT;
    if (ready < 0) {
        // A signal (Ctrl+C) interrupts the wait; the caller's loop checks
        // its shutdown signal and decides whether to wait again.
        return (errno == EINTR) ? RecvStatus::TIMEOUT : RecvStatus::ERROR;
    }
    if (pfd.revents & POLLNVAL) {
        errno = EBADF;
        return RecvStatus::ERROR;
    }
    // POLLERR / POLLHUP are reported as readable: the following recv()
    // returns the actual error or EOF.
    return RecvStatus::DATA;
}

RecvStatus receive_datagram(int fd, uint8_t* buffer, size_t capacity,
                            std::chrono::milliseconds timeout,
                            size_t& received, sockaddr_in* from) {
    received = 0;

    RecvStatus status = wait_readable(fd, timeout);
    if (status != RecvStatus::DATA) return status;

    sockaddr_in sender;
    socklen_t sender_len = sizeof(sender);
    std::memset(&sender, 0, sizeof(sender));

    ssize_t n = ::recvfrom(fd, buffer, capacity, MSG_DONTWAIT,
                           reinterpret_cast<sockaddr*>(&sender), &sender_len);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return RecvStatus::TIMEOUT;
        }
        return RecvStatus::ERROR;
    }

    received = static_cast<size_t>(n);
    if (from) *from = sender;
    return RecvStatus::DATA;
}

int accept_connection(int listen_fd, std::chrono::milliseconds timeout,
                      sockaddr_in& peer, RecvStatus& status) {
    status = wait_readable(listen_fd, timeout);
    if (status != RecvStatus::DATA) return -1;

    socklen_t peer_len = sizeof(peer);
    int client_fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&peer), &peer_len);
    if (client_fd < 0) {
        // The connection may have been reset between poll() and accept()
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR ||
            errno == ECONNABORTED) {
            status = RecvStatus::TIMEOUT;
        } else {
            status = RecvStatus::ERROR;
        }
        return -1;
    }
    return client_fd;
}

//==============================================================================
// SECTION 2: STREAM HELPERS
//==============================================================================

bool connect_with_timeout(int fd, const sockaddr_in& address,
                          std::chrono::milliseconds timeout) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;

    int rc = ::connect(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address));
    if (rc < 0 && errno != EINPROGRESS) {
        return false;
    }

    if (rc < 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        // EINTR retries wait only for what is left of the original timeout
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        int ready;
        do {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left < std::chrono::milliseconds::zero()) left = std::chrono::milliseconds::zero();
            ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            errno = ETIMEDOUT;
            return false;
        }
        if (ready < 0) return false;

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) return false;
        if (so_error != 0) {
            errno = so_error;
            return false;
        }
    }

    // Back to blocking; transfers rely on SO_RCVTIMEO / SO_SNDTIMEO
    return ::fcntl(fd, F_SETFL, flags) == 0;
}

bool send_all(int fd, const uint8_t* data, size_t length) {
    size_t sent = 0;
    while (sent < length) {
        ssize_t n = ::send(fd, data + sent, length - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool set_io_timeouts(int fd, std::chrono::milliseconds timeout) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) return false;
    if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) return false;
    return true;
}

//==============================================================================
// SECTION 3: ADDRESSES & LIFETIME
//==============================================================================

bool make_ipv4_address(const std::string& ip, uint16_t port, sockaddr_in& out) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return ::inet_pton(AF_INET, ip.c_str(), &out.sin_addr) == 1;
}

std::string ip_to_string(const sockaddr_in& address) {
    char ip[INET_ADDRSTRLEN];
    if (::inet_ntop(AF_INET, &address.sin_addr, ip, INET_ADDRSTRLEN) == nullptr) {
        return "?";
    }
    return std::string(ip);
}

std::string address_to_string(const sockaddr_in& address) {
    return ip_to_string(address) + ":" + std::to_string(ntohs(address.sin_port));
}

uint16_t local_port(int fd) {
    sockaddr_in address;
    socklen_t len = sizeof(address);
    std::memset(&address, 0, sizeof(address));
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&address), &len) < 0) {
        return 0;
    }
    return ntohs(address.sin_port);
}

void close_socket(int fd) {
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

} // namespace netspeed
