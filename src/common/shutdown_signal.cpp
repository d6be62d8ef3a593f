/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: shutdown_signal.cpp

*******************************************************************************/

#include "common/shutdown_signal.h"

namespace netspeed {

void ShutdownSignal::trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        triggered_ = true;
    }
    cv_.notify_all();
}

bool ShutdownSignal::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return triggered_.load(); });
}

void ShutdownSignal::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    triggered_ = false;
}

} // namespace netspeed
