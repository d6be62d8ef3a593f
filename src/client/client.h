/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: client.h

    Description:
        SpeedTestClient runs the client state machine:

            ┌──────────────┐  offer   ┌──────────────┐
            │  DISCOVERY   │ ───────► │  SPEED TEST  │
            │ (10 s tries) │ ◄─────── │ N TCP + M UDP│
            └──────────────┘   done   └──────────────┘

        Discovery timeouts are not errors: the client logs "retrying" and
        listens again. A speed test launches every transfer at once, waits
        for all of them and prints one line per transfer.

        run() only returns when the shutdown signal fires, when discovery
        cannot open its socket, or after one test if config.once is set.

*******************************************************************************/

#ifndef SPEEDTEST_CLIENT_H
#define SPEEDTEST_CLIENT_H

#include "client/offer_listener.h"
#include "common/message.h"
#include "common/shutdown_signal.h"
#include "common/transfer_stats.h"

#include <chrono>
#include <cstdint>
#include <vector>

namespace netspeed {

struct ClientConfig {
    uint16_t discovery_port;
    uint64_t file_size;
    int tcp_connections;
    int udp_connections;
    std::chrono::milliseconds discovery_deadline;
    std::chrono::milliseconds poll_interval;
    std::chrono::milliseconds quiet_period;
    std::chrono::milliseconds tcp_timeout;
    bool once;                          // stop after the first speed test

    ClientConfig()
        : discovery_port(DEFAULT_DISCOVERY_PORT),
          file_size(0),
          tcp_connections(1),
          udp_connections(1),
          discovery_deadline(10000),
          poll_interval(500),
          quiet_period(1000),
          tcp_timeout(5000),
          once(false) {}
};

class SpeedTestClient {
public:
    explicit SpeedTestClient(const ClientConfig& config);

    // Returns the number of completed speed tests
    int run(ShutdownSignal& shutdown);

    // One round against 'offer': TCP results first, then UDP, each group
    // in index order
    std::vector<TransferResult> run_speed_test(const ServerOffer& offer);

    const ClientConfig& config() const { return config_; }

private:
    ClientConfig config_;
};

} // namespace netspeed

#endif // SPEEDTEST_CLIENT_H
