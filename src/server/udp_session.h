/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: udp_session.h

    Description:
        Server half of a UDP transfer. Given a validated Request and the
        address it came from, sends the requested size as numbered
        PayloadMessage segments:

            total = ceil(file_size / chunk_size)
            segment i (1-based) carries min(chunk, file_size - (i-1)*chunk)
            bytes of 'Y' filler

        Each call opens its own ephemeral UDP socket, so concurrent
        transfers never share a descriptor and the listening endpoint stays
        free for new requests.

        The first failed sendto() aborts the remaining segments (logged).
        There is no pacing and no end-of-stream marker: the client detects
        the end by its quiet period.

*******************************************************************************/

#ifndef UDP_SESSION_H
#define UDP_SESSION_H

#include <cstddef>
#include <cstdint>

#include <netinet/in.h>

namespace netspeed {

constexpr char UDP_FILLER_BYTE = 'Y';

// Sends all segments for 'file_size' to 'client' from a fresh socket.
// Returns the number of segments actually sent.
uint64_t serve_udp_request(const sockaddr_in& client, uint64_t file_size,
                           size_t chunk_size);

// Same, from a socket the caller owns (not closed here)
uint64_t send_segments(int fd, const sockaddr_in& client, uint64_t file_size,
                       size_t chunk_size);

} // namespace netspeed

#endif // UDP_SESSION_H
