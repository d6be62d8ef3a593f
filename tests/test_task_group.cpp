/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: test_task_group.cpp

    Description:
        Tests for the concurrency helpers: TaskGroup result ordering,
        parallelism and exception propagation, and ShutdownSignal wake-up.

*******************************************************************************/

#include "common/task_group.h"
#include "common/shutdown_signal.h"
#include "common/logger.h"

#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace netspeed;

using Clock = std::chrono::steady_clock;

static double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

int main() {
    Logger::set_level(LogLevel::INFO);
    Logger::info("Running TaskGroup tests...");

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Results come back in spawn order... ";
        try {
            TaskGroup<int> group;
            for (int i = 1; i <= 5; ++i) {
                // Later tasks finish first
                group.spawn([i]() {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10 * (6 - i)));
                    return i * i;
                });
            }
            assert(group.size() == 5);

            std::vector<int> results = group.join_all();
            assert(results.size() == 5);
            for (int i = 1; i <= 5; ++i) {
                assert(results[i - 1] == i * i);
            }

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Tasks run concurrently... ";
        try {
            TaskGroup<bool> group;
            Clock::time_point start = Clock::now();
            for (int i = 0; i < 4; ++i) {
                group.spawn([]() {
                    std::this_thread::sleep_for(std::chrono::milliseconds(200));
                    return true;
                });
            }
            group.join_all();

            // Serially this would be 0.8 s
            assert(seconds_since(start) < 0.6);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: A failing task rethrows after all finish... ";
        try {
            std::atomic<int> finished(0);
            TaskGroup<int> group;
            group.spawn([]() -> int {
                throw std::runtime_error("boom");
            });
            group.spawn([&finished]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                finished++;
                return 2;
            });

            bool threw = false;
            try {
                group.join_all();
            } catch (const std::runtime_error& e) {
                threw = (std::string(e.what()) == "boom");
            }
            assert(threw);
            assert(finished == 1);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Empty group joins immediately... ";
        try {
            TaskGroup<int> group;
            assert(group.join_all().empty());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: ShutdownSignal wakes a sleeping waiter... ";
        try {
            ShutdownSignal signal;
            assert(!signal.triggered());

            // Not triggered: the full wait elapses and false is returned
            Clock::time_point start = Clock::now();
            assert(!signal.wait_for(std::chrono::milliseconds(50)));
            assert(seconds_since(start) >= 0.045);

            std::thread trigger([&signal]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                signal.trigger();
            });

            start = Clock::now();
            bool woke = signal.wait_for(std::chrono::milliseconds(5000));
            trigger.join();

            assert(woke);
            assert(seconds_since(start) < 1.0);
            assert(signal.triggered());

            // Already triggered: returns at once
            assert(signal.wait_for(std::chrono::milliseconds(5000)));

            signal.reset();
            assert(!signal.triggered());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
