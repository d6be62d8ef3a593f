/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: udp_session.cpp

*******************************************************************************/

#include "server/udp_session.h"
#include "server/endpoint.h"
#include "common/logger.h"
#include "common/message.h"
#include "common/socket_utils.h"
#include "common/transfer_stats.h"

#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace netspeed {

uint64_t send_segments(int fd, const sockaddr_in& client, uint64_t file_size,
                       size_t chunk_size) {
    if (chunk_size == 0 || chunk_size > MAX_DATAGRAM_SIZE - PayloadMessage::HEADER_SIZE) {
        Logger::error("Invalid UDP chunk size: " + std::to_string(chunk_size));
        return 0;
    }

    PayloadMessage header;
    header.total_segments = total_segments_for(file_size, chunk_size);

    // Header is rewritten per segment, the filler never changes
    std::vector<uint8_t> datagram(PayloadMessage::HEADER_SIZE + chunk_size,
                                  static_cast<uint8_t>(UDP_FILLER_BYTE));

    uint64_t sent = 0;
    for (uint64_t i = 1; i <= header.total_segments; i++) {
        header.current_segment = i;
        header.serialize_header(datagram.data());

        size_t length = PayloadMessage::HEADER_SIZE + segment_length(file_size, chunk_size, i);
        ssize_t n = sendto(fd, datagram.data(), length, 0,
                           (struct sockaddr*)&client, sizeof(client));
        if (n != static_cast<ssize_t>(length)) {
            Logger::error("Error sending UDP segment " + std::to_string(i) + "/" +
                          std::to_string(header.total_segments) + " to " +
                          address_to_string(client) + ": " +
                          (n < 0 ? std::string(strerror(errno)) : std::string("short write")));
            break;
        }
        sent++;
    }

    return sent;
}

uint64_t serve_udp_request(const sockaddr_in& client, uint64_t file_size,
                           size_t chunk_size) {
    uint16_t port = 0;
    int fd = open_udp_endpoint(port);
    if (fd < 0) {
        Logger::error("UDP " + address_to_string(client) + ": no socket for transfer");
        return 0;
    }

    Logger::info("UDP " + address_to_string(client) + ": client requested " +
                 std::to_string(file_size) + " bytes");

    uint64_t sent = send_segments(fd, client, file_size, chunk_size);

    Logger::debug("UDP " + address_to_string(client) + ": sent " +
                  std::to_string(sent) + "/" +
                  std::to_string(total_segments_for(file_size, chunk_size)) + " segments");

    close_socket(fd);
    return sent;
}

} // namespace netspeed
