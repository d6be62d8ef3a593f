/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: tcp_session.h

    Description:
        Server half of a TCP transfer. One call handles one accepted
        connection from request to close:

        1. Read the request one byte at a time up to '\n'
        2. Parse it as a decimal byte count
        3. Stream exactly that many filler bytes in chunk_size writes
        4. Close the connection

    Outcomes (TcpServeStatus):
        COMPLETED          all requested bytes were written
        CLIENT_CLOSED      peer closed before sending a full line (clean)
        MALFORMED_REQUEST  line is not a number or longer than
                           MAX_SIZE_LINE_LENGTH; nothing is sent
        RECEIVE_FAILED     recv() failed or timed out while reading the line
        SEND_FAILED        a write failed mid-stream; the rest is skipped

        Only the affected connection is aborted in every case; the accept
        loop is never told.

    Example (5000 bytes, chunk 4096):
        writes == 2, last_write == 904, bytes_sent == 5000

*******************************************************************************/

#ifndef TCP_SESSION_H
#define TCP_SESSION_H

#include <chrono>
#include <cstddef>
#include <cstdint>

#include <netinet/in.h>

namespace netspeed {

// Digits of UINT64_MAX plus room for whitespace / "\r"
constexpr size_t MAX_SIZE_LINE_LENGTH = 32;

// Byte the TCP stream is filled with
constexpr char TCP_FILLER_BYTE = 'X';

enum class TcpServeStatus {
    COMPLETED,
    CLIENT_CLOSED,
    MALFORMED_REQUEST,
    RECEIVE_FAILED,
    SEND_FAILED
};

const char* tcp_serve_status_name(TcpServeStatus status);

struct TcpStreamResult {
    uint64_t bytes_sent;
    uint64_t writes;        // number of chunk writes that succeeded
    size_t last_write;      // size of the final successful write
    bool completed;         // bytes_sent == requested size

    TcpStreamResult() : bytes_sent(0), writes(0), last_write(0), completed(false) {}
};

struct TcpServeOutcome {
    TcpServeStatus status;
    uint64_t requested_size;
    TcpStreamResult stream;

    TcpServeOutcome() : status(TcpServeStatus::CLIENT_CLOSED), requested_size(0) {}
};

// Writes 'size' filler bytes to 'fd' in writes of at most 'chunk_size'.
// Stops at the first failed write.
TcpStreamResult stream_filler(int fd, uint64_t size, size_t chunk_size);

// Handles one accepted connection and ALWAYS closes 'fd' before returning.
// 'io_timeout' bounds every recv()/send() on the connection.
TcpServeOutcome serve_tcp_client(int fd, const sockaddr_in& peer,
                                 size_t chunk_size,
                                 std::chrono::milliseconds io_timeout);

} // namespace netspeed

#endif // TCP_SESSION_H
