/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: shutdown_signal.h

    Description:
        One-shot cooperative stop signal handed to every long-running loop
        (offer broadcast, TCP accept, UDP request receive, client discovery).

        Loops call triggered() between bounded blocking operations and use
        wait_for() instead of sleep_for(), so a broadcast loop sleeping for
        its 1 second interval wakes up as soon as stop() is requested.

    Usage:
        ShutdownSignal shutdown;
        std::thread t([&] {
            while (!shutdown.triggered()) {
                do_one_tick();
                shutdown.wait_for(std::chrono::seconds(1));
            }
        });
        ...
        shutdown.trigger();
        t.join();

    Thread Safety:
        All members may be called from any thread. trigger() is NOT
        async-signal-safe (it takes a mutex); signal handlers set an atomic
        flag and let main() call trigger().

*******************************************************************************/

#ifndef SHUTDOWN_SIGNAL_H
#define SHUTDOWN_SIGNAL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace netspeed {

class ShutdownSignal {
private:
    std::atomic<bool> triggered_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

public:
    ShutdownSignal() : triggered_(false) {}

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    // Idempotent; wakes every waiter
    void trigger();

    bool triggered() const { return triggered_.load(); }

    // Sleeps up to 'timeout'. Returns true if the signal fired (before or
    // during the wait), false if the full timeout elapsed.
    bool wait_for(std::chrono::milliseconds timeout);

    // Re-arms a signal whose loops have all exited (server restart)
    void reset();
};

} // namespace netspeed

#endif // SHUTDOWN_SIGNAL_H
