/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: udp_download.h

    Description:
        Client half of a UDP transfer.

        1. Bind a UDP socket to an ephemeral port
        2. Send a RequestMessage to the server's UDP port
        3. Receive PayloadMessage segments; each valid one restarts the
           quiet clock
        4. Stop once 'quiet_period' passes with no valid segment

        The wait for each datagram is the time left in the quiet period,
        so the loop ends as soon as the period runs out. The measured
        duration spans from just before the request to the end of the
        loop, quiet period included.

        A lost final segment and a finished transfer look the same here:
        both end with a quiet period. Losses show up only in the success
        rate (received / total_segments).

*******************************************************************************/

#ifndef UDP_DOWNLOAD_H
#define UDP_DOWNLOAD_H

#include "common/transfer_stats.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace netspeed {

TransferResult run_udp_transfer(const std::string& server_ip, uint16_t udp_port,
                                uint64_t file_size, int index,
                                std::chrono::milliseconds quiet_period);

} // namespace netspeed

#endif // UDP_DOWNLOAD_H
