/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: tcp_session.cpp

    Description:
        Implementation of the server-side TCP transfer (request line +
        filler stream). See tcp_session.h for the outcome table.

*******************************************************************************/

#include "server/tcp_session.h"
#include "common/logger.h"
#include "common/message.h"
#include "common/socket_utils.h"

#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace netspeed {

const char* tcp_serve_status_name(TcpServeStatus status) {
    switch (status) {
        case TcpServeStatus::COMPLETED:
            return "COMPLETED";
        case TcpServeStatus::CLIENT_CLOSED:
            return "CLIENT_CLOSED";
        case TcpServeStatus::MALFORMED_REQUEST:
            return "MALFORMED_REQUEST";
        case TcpServeStatus::RECEIVE_FAILED:
            return "RECEIVE_FAILED";
        case TcpServeStatus::SEND_FAILED:
            return "SEND_FAILED";
        default:
            return "UNKNOWN";
    }
}

//==============================================================================
// SECTION 1: REQUEST LINE
//==============================================================================
//
// Byte-at-a-time reads: the request is a handful of bytes and reading one
// byte at a time guarantees nothing past '\n' is consumed.
//
// Returns true with 'line' filled (without the '\n'), or false with the
// reason in 'failure'.
//

static bool read_request_line(int fd, std::string& line, TcpServeStatus& failure) {
    line.clear();

    while (true) {
        char c;
        ssize_t n = recv(fd, &c, 1, 0);

        if (n == 0) {
            failure = TcpServeStatus::CLIENT_CLOSED;
            return false;
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            failure = TcpServeStatus::RECEIVE_FAILED;
            return false;
        }

        if (c == '\n') return true;

        line.push_back(c);
        if (line.size() > MAX_SIZE_LINE_LENGTH) {
            failure = TcpServeStatus::MALFORMED_REQUEST;
            return false;
        }
    }
}

//==============================================================================
// SECTION 2: FILLER STREAM
//==============================================================================

TcpStreamResult stream_filler(int fd, uint64_t size, size_t chunk_size) {
    TcpStreamResult result;
    if (chunk_size == 0) chunk_size = DEFAULT_TCP_CHUNK_SIZE;

    // One chunk of filler is reused for every write
    const std::vector<uint8_t> filler(
        static_cast<size_t>(std::min<uint64_t>(chunk_size, size)),
        static_cast<uint8_t>(TCP_FILLER_BYTE));

    while (result.bytes_sent < size) {
        size_t to_send = static_cast<size_t>(
            std::min<uint64_t>(chunk_size, size - result.bytes_sent));

        if (!send_all(fd, filler.data(), to_send)) {
            Logger::error("Error sending TCP data: " + std::string(strerror(errno)) +
                          " (" + std::to_string(result.bytes_sent) + "/" +
                          std::to_string(size) + " bytes sent)");
            break;
        }

        result.bytes_sent += to_send;
        result.writes++;
        result.last_write = to_send;
    }

    result.completed = (result.bytes_sent == size);
    return result;
}

//==============================================================================
// SECTION 3: CONNECTION HANDLER
//==============================================================================

TcpServeOutcome serve_tcp_client(int fd, const sockaddr_in& peer,
                                 size_t chunk_size,
                                 std::chrono::milliseconds io_timeout) {
    TcpServeOutcome outcome;
    const std::string who = address_to_string(peer);

    if (!set_io_timeouts(fd, io_timeout)) {
        Logger::warning("TCP " + who + ": failed to set socket timeouts: " +
                        std::string(strerror(errno)));
    }

    std::string line;
    TcpServeStatus failure = TcpServeStatus::CLIENT_CLOSED;

    if (!read_request_line(fd, line, failure)) {
        outcome.status = failure;
        switch (failure) {
            case TcpServeStatus::CLIENT_CLOSED:
                Logger::info("TCP " + who + ": client closed before sending a request");
                break;
            case TcpServeStatus::MALFORMED_REQUEST:
                Logger::error("TCP " + who + ": request line too long");
                break;
            default:
                Logger::error("TCP " + who + ": failed to read request: " +
                              std::string(strerror(errno)));
                break;
        }
        close_socket(fd);
        return outcome;
    }

    auto size = parse_size_line(line);
    if (!size) {
        Logger::error("TCP " + who + ": invalid file size: '" + line + "'");
        outcome.status = TcpServeStatus::MALFORMED_REQUEST;
        close_socket(fd);
        return outcome;
    }

    outcome.requested_size = *size;
    Logger::info("TCP " + who + ": client requested " + std::to_string(*size) + " bytes");

    outcome.stream = stream_filler(fd, *size, chunk_size);
    outcome.status = outcome.stream.completed ? TcpServeStatus::COMPLETED
                                              : TcpServeStatus::SEND_FAILED;

    Logger::debug("TCP " + who + ": sent " + std::to_string(outcome.stream.bytes_sent) +
                  " bytes in " + std::to_string(outcome.stream.writes) + " writes");

    close_socket(fd);
    return outcome;
}

} // namespace netspeed
