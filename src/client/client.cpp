/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: client.cpp

*******************************************************************************/

#include "client/client.h"
#include "client/tcp_download.h"
#include "client/udp_download.h"
#include "common/logger.h"
#include "common/task_group.h"

#include <exception>
#include <string>

namespace netspeed {

SpeedTestClient::SpeedTestClient(const ClientConfig& config)
    : config_(config) {}

int SpeedTestClient::run(ShutdownSignal& shutdown) {
    OfferListener listener(config_.discovery_port, config_.poll_interval);
    if (!listener.open()) {
        return 0;
    }

    Logger::info("Client started, listening for offer requests...");

    int completed = 0;
    while (!shutdown.triggered()) {
        Logger::info("Looking for a server offer...");

        auto offer = listener.listen_for_offer(config_.discovery_deadline, &shutdown);
        if (!offer) {
            if (shutdown.triggered()) break;
            Logger::warning("No server offer received within " +
                            std::to_string(config_.discovery_deadline.count() / 1000) +
                            " seconds. Retrying...");
            continue;
        }

        Logger::info("Initiating speed test => UDP:" + std::to_string(offer->udp_port) +
                     ", TCP:" + std::to_string(offer->tcp_port));

        run_speed_test(*offer);
        completed++;

        Logger::info("All transfers complete, listening to offer requests...");
        if (config_.once) break;
    }

    return completed;
}

std::vector<TransferResult> SpeedTestClient::run_speed_test(const ServerOffer& offer) {
    TaskGroup<TransferResult> group;

    const std::string ip = offer.server_ip;
    const uint64_t size = config_.file_size;

    for (int i = 1; i <= config_.tcp_connections; ++i) {
        const uint16_t port = offer.tcp_port;
        const std::chrono::milliseconds timeout = config_.tcp_timeout;
        group.spawn([ip, port, size, i, timeout]() {
            return run_tcp_transfer(ip, port, size, i, timeout);
        });
    }

    for (int i = 1; i <= config_.udp_connections; ++i) {
        const uint16_t port = offer.udp_port;
        const std::chrono::milliseconds quiet = config_.quiet_period;
        group.spawn([ip, port, size, i, quiet]() {
            return run_udp_transfer(ip, port, size, i, quiet);
        });
    }

    std::vector<TransferResult> results;
    try {
        results = group.join_all();
    } catch (const std::exception& e) {
        Logger::error("Transfer task failed: " + std::string(e.what()));
        return results;
    }

    for (const auto& result : results) {
        Logger::info(format_result(result));
    }
    return results;
}

} // namespace netspeed
