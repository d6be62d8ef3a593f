/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: transfer_stats.h

    Description:
        Measurement side of the speed test: the per-transfer result record,
        the arithmetic that turns raw counts into throughput and success
        rate, segment planning for UDP transfers, and the receive tracker
        that the client feeds every datagram into.

        Core Components:
        - TransferResult: value returned by every TCP/UDP transfer task
        - compute_throughput_bps / compute_success_rate
        - total_segments_for / segment_length: UDP segmentation plan
        - UdpReceiveTracker: counts segments and bytes, owns the
          quiet-period clock
        - format_result: the one-line report printed per transfer

    Design Notes:
        A transfer never "fails" as a whole. Timeouts, resets and lost
        datagrams only shrink the counts, so every task returns a
        TransferResult, possibly with zero bytes.

        All functions here are pure (no sockets, no clocks read inside),
        which keeps them directly testable.

*******************************************************************************/

#ifndef TRANSFER_STATS_H
#define TRANSFER_STATS_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <chrono>

namespace netspeed {

//==============================================================================
// SECTION 1: TRANSFER RESULT
//==============================================================================

enum class TransferProtocol : uint8_t {
    TCP = 0,
    UDP = 1
};

// "TCP" / "UDP"
const char* protocol_name(TransferProtocol protocol);

// Floor for measured durations so a zero-length measurement never divides
// by zero (one microsecond).
constexpr double MIN_DURATION_SEC = 1e-6;

struct TransferResult {
    TransferProtocol protocol;

    // 1-based position of this connection within its protocol group
    int index;

    // Payload bytes actually received (UDP headers excluded)
    uint64_t bytes_transferred;

    // Wall-clock seconds, already floored to MIN_DURATION_SEC
    double duration_sec;

    // UDP only: total_segments as announced by the server (0 if nothing
    // arrived) and the number of valid segments seen
    uint64_t segments_expected;
    uint64_t segments_received;

    TransferResult() : protocol(TransferProtocol::TCP), index(0),
                       bytes_transferred(0), duration_sec(MIN_DURATION_SEC),
                       segments_expected(0), segments_received(0) {}

    double throughput_bps() const;
    double success_rate() const;
};

//==============================================================================
// SECTION 2: RATE COMPUTATIONS
//==============================================================================

// max(duration_sec, MIN_DURATION_SEC)
double floor_duration(double duration_sec);

// bytes * 8 / floor_duration(duration_sec)
double compute_throughput_bps(uint64_t bytes, double duration_sec);

// received / total * 100, or 0.0 when total == 0
double compute_success_rate(uint64_t received, uint64_t total);

//==============================================================================
// SECTION 3: UDP SEGMENT PLANNING
//==============================================================================
//
// total_segments_for(2500, 1024) == 3
// segment_length(2500, 1024, 1) == 1024
// segment_length(2500, 1024, 3) == 452
//
// A chunk_size of 0 yields 0 segments. Indexes outside 1..total yield 0.
//

uint64_t total_segments_for(uint64_t file_size, size_t chunk_size);
size_t segment_length(uint64_t file_size, size_t chunk_size, uint64_t index);

//==============================================================================
// SECTION 4: UDP RECEIVE TRACKER
//==============================================================================
//
// Fed every datagram the client's UDP socket returns. Only valid payload
// segments count and only they move the quiet-period clock; anything else
// is dropped without side effects.
//
// The tracker cannot tell "server finished" from "the tail was lost", and
// does not try to: the transfer ends after a quiet period either way.
//

class UdpReceiveTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit UdpReceiveTracker(Clock::time_point start);

    // Returns true if the datagram was a valid payload segment
    bool on_datagram(const uint8_t* data, size_t size, Clock::time_point now);

    // Time left before the quiet period expires (zero or negative = done)
    Clock::duration remaining_quiet(Clock::time_point now, Clock::duration quiet) const;

    bool quiet_period_elapsed(Clock::time_point now, Clock::duration quiet) const {
        return remaining_quiet(now, quiet) <= Clock::duration::zero();
    }

    uint64_t segments_received() const { return segments_received_; }
    uint64_t total_segments() const { return total_segments_; }
    uint64_t payload_bytes() const { return payload_bytes_; }
    Clock::time_point last_receive() const { return last_receive_; }

    // Snapshot as a UDP TransferResult measured from start to 'end'
    TransferResult finish(int index, Clock::time_point end) const;

private:
    Clock::time_point start_;
    Clock::time_point last_receive_;
    uint64_t segments_received_;
    uint64_t total_segments_;
    uint64_t payload_bytes_;
};

//==============================================================================
// SECTION 5: REPORTING
//==============================================================================
//
// TCP: "TCP transfer #1 finished, total time: 0.004 seconds,
//       total speed: 10000000.00 bits/second"
// UDP: same, plus ", percentage of packets received successfully: 66.67%"
//

std::string format_result(const TransferResult& result);

} // namespace netspeed

#endif // TRANSFER_STATS_H
