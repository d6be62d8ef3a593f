/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: tcp_download.h

    Description:
        Client half of a TCP transfer: connect, send "<size>\n", read until
        'file_size' bytes have arrived or the stream ends.

        Timing starts before connect() and stops after the last read, so
        connection setup is part of the measured time.

        A failed connect, a read error or a read timeout ends the transfer
        early (logged); the result then reports whatever arrived.

*******************************************************************************/

#ifndef TCP_DOWNLOAD_H
#define TCP_DOWNLOAD_H

#include "common/transfer_stats.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace netspeed {

constexpr size_t TCP_RECEIVE_BUFFER_SIZE = 4096;

TransferResult run_tcp_transfer(const std::string& server_ip, uint16_t tcp_port,
                                uint64_t file_size, int index,
                                std::chrono::milliseconds timeout);

} // namespace netspeed

#endif // TCP_DOWNLOAD_H
