/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: socket_utils.h

    Description:
        Thin helpers over the POSIX socket API used by both the server and
        the client. Sockets are plain file descriptors owned by whichever
        loop or transfer task created them; close_socket() is the single
        way they are released.

        Core Components:
        - RecvStatus: explicit outcome of a bounded wait (data / timeout /
          peer closed / error), so receive loops branch on a value instead
          of catching timeout errors
        - wait_readable, receive_datagram, accept_connection: bounded
          blocking primitives built on poll()
        - connect_with_timeout: non-blocking connect bounded by a deadline
        - send_all: loops until the whole buffer is written
        - set_io_timeouts: SO_RCVTIMEO / SO_SNDTIMEO for stream sockets
        - make_ipv4_address, address_to_string, ip_to_string

    Error Reporting:
        Functions return bool / RecvStatus / -1 and leave errno intact for
        the caller to log with strerror(errno). Nothing here logs, so each
        caller decides whether a failure is worth a WARN or an ERROR.

*******************************************************************************/

#ifndef SOCKET_UTILS_H
#define SOCKET_UTILS_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <chrono>

#include <sys/socket.h>
#include <netinet/in.h>

namespace netspeed {

enum class RecvStatus {
    DATA,       // bytes (or a pending connection) are available
    TIMEOUT,    // nothing arrived within the wait; EINTR is reported as this
    CLOSED,     // stream peer performed an orderly shutdown
    ERROR       // socket error, errno is set
};

const char* recv_status_name(RecvStatus status);

//==============================================================================
// SECTION 1: BOUNDED WAITS
//==============================================================================

// poll(POLLIN) for at most 'timeout'
RecvStatus wait_readable(int fd, std::chrono::milliseconds timeout);

// Waits up to 'timeout' for one datagram. On DATA, 'received' holds its
// length and 'from' (if not null) the sender.
RecvStatus receive_datagram(int fd, uint8_t* buffer, size_t capacity,
                            std::chrono::milliseconds timeout,
                            size_t& received, sockaddr_in* from);

// Waits up to 'timeout' for a pending connection on a listening socket.
// Returns the accepted fd on DATA, -1 otherwise.
int accept_connection(int listen_fd, std::chrono::milliseconds timeout,
                      sockaddr_in& peer, RecvStatus& status);

//==============================================================================
// SECTION 2: STREAM HELPERS
//==============================================================================

// Non-blocking connect that gives up after 'timeout'. The socket is put
// back into blocking mode before returning true.
bool connect_with_timeout(int fd, const sockaddr_in& address,
                          std::chrono::milliseconds timeout);

// Writes the whole buffer (MSG_NOSIGNAL, EINTR retried). False on any
// error, including a send timeout set through set_io_timeouts().
bool send_all(int fd, const uint8_t* data, size_t length);

// SO_RCVTIMEO and SO_SNDTIMEO
bool set_io_timeouts(int fd, std::chrono::milliseconds timeout);

//==============================================================================
// SECTION 3: ADDRESSES & LIFETIME
//==============================================================================

// inet_pton wrapper; false if 'ip' is not a dotted IPv4 address
bool make_ipv4_address(const std::string& ip, uint16_t port, sockaddr_in& out);

// "10.0.0.7"
std::string ip_to_string(const sockaddr_in& address);

// "10.0.0.7:51234"
std::string address_to_string(const sockaddr_in& address);

// Port of the local end of 'fd' (getsockname), 0 on failure
uint16_t local_port(int fd);

// shutdown() + close(); ignores fd < 0
void close_socket(int fd);

} // namespace netspeed

#endif // SOCKET_UTILS_H
