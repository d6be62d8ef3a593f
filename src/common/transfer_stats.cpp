/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: transfer_stats.cpp

    Description:
        Implementation of transfer measurement, segment planning and the UDP
        receive tracker declared in transfer_stats.h.

*******************************************************************************/

#include "common/transfer_stats.h"
#include "common/message.h"

#include <algorithm>
#include <sstream>
#include <iomanip>

namespace netspeed {

//==============================================================================
// SECTION 1: TRANSFER RESULT
//==============================================================================

const char* protocol_name(TransferProtocol protocol) {
    switch (protocol) {
        case TransferProtocol::TCP:
            return "TCP";
        case TransferProtocol::UDP:
            return "UDP";
        default:
            return "UNKNOWN";
    }
}

double TransferResult::throughput_bps() const {
    return compute_throughput_bps(bytes_transferred, duration_sec);
}

double TransferResult::success_rate() const {
    return compute_success_rate(segments_received, segments_expected);
}

//==============================================================================
// SECTION 2: RATE COMPUTATIONS
//==============================================================================

double floor_duration(double duration_sec) {
    return std::max(duration_sec, MIN_DURATION_SEC);
}

double compute_throughput_bps(uint64_t bytes, double duration_sec) {
    return (static_cast<double>(bytes) * 8.0) / floor_duration(duration_sec);
}

double compute_success_rate(uint64_t received, uint64_t total) {
    if (total == 0) return 0.0;
    return (static_cast<double>(received) / static_cast<double>(total)) * 100.0;
}

//==============================================================================
// SECTION 3: UDP SEGMENT PLANNING
//==============================================================================

uint64_t total_segments_for(uint64_t file_size, size_t chunk_size) {
    if (chunk_size == 0) return 0;
    uint64_t chunk = static_cast<uint64_t>(chunk_size);
    return (file_size / chunk) + ((file_size % chunk) ? 1 : 0);
}

size_t segment_length(uint64_t file_size, size_t chunk_size, uint64_t index) {
    uint64_t total = total_segments_for(file_size, chunk_size);
    if (index == 0 || index > total) return 0;

    uint64_t chunk = static_cast<uint64_t>(chunk_size);
    uint64_t offset = (index - 1) * chunk;
    return static_cast<size_t>(std::min(chunk, file_size - offset));
}

//==============================================================================
// SECTION 4: UDP RECEIVE TRACKER
//==============================================================================

UdpReceiveTracker::UdpReceiveTracker(Clock::time_point start)
    : start_(start),
      last_receive_(start),         // quiet clock starts when the request goes out
      segments_received_(0),
      total_segments_(0),
      payload_bytes_(0) {
}

bool UdpReceiveTracker::on_datagram(const uint8_t* data, size_t size,
                                    Clock::time_point now) {
    auto segment = PayloadMessage::deserialize(data, size);
    if (!segment) {
        return false;
    }

    // Every segment of a transfer carries the same total
    total_segments_ = segment->total_segments;
    segments_received_++;
    payload_bytes_ += segment->data.size();
    last_receive_ = now;
    return true;
}

UdpReceiveTracker::Clock::duration
UdpReceiveTracker::remaining_quiet(Clock::time_point now, Clock::duration quiet) const {
    return quiet - (now - last_receive_);
}

TransferResult UdpReceiveTracker::finish(int index, Clock::time_point end) const {
    TransferResult result;
    result.protocol = TransferProtocol::UDP;
    result.index = index;
    result.bytes_transferred = payload_bytes_;
    result.duration_sec = floor_duration(
        std::chrono::duration<double>(end - start_).count());
    result.segments_expected = total_segments_;
    result.segments_received = segments_received_;
    return result;
}

//==============================================================================
// SECTION 5: REPORTING
//==============================================================================

std::string format_result(const TransferResult& result) {
    std::stringstream ss;
    ss << std::fixed
       << protocol_name(result.protocol) << " transfer #" << result.index
       << " finished, total time: " << std::setprecision(3) << result.duration_sec
       << " seconds, total speed: " << std::setprecision(2) << result.throughput_bps()
       << " bits/second";

    if (result.protocol == TransferProtocol::UDP) {
        ss << ", percentage of packets received successfully: "
           << std::setprecision(2) << result.success_rate() << "%";
    }
    return ss.str();
}

} // namespace netspeed
