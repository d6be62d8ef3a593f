/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: logger.h

    Description:
        This header defines the Logger class used by every component of the
        speed test (server loops, per-connection handlers, client transfer
        tasks). The Logger provides thread-safe, level-filtered logging with
        millisecond-precision timestamps.

        Core Features:
        - Thread-safe output using a static std::mutex (dozens of transfer
          threads may report at the same time)
        - Configurable log levels (DEBUG, INFO, WARNING, ERROR)
        - Millisecond timestamps so server and client logs can be lined up
        - Optional ANSI coloring of warnings and errors on a terminal
        - Header-only implementation (logger.cpp only defines the statics)

    Output Format:
        [2025-11-27 14:03:12.481] [INFO] TCP transfer #1 finished, ...

    Thread Safety Model:
        - Level check happens before the lock (filtered messages are cheap)
        - std::lock_guard serializes the actual write to stdout
        - set_level()/set_color() are meant to be called once from main()
          before any thread is started

    Related Files:
        - logger.cpp: static member definitions
        - main_server.cpp / main_client.cpp: --log-level handling

*******************************************************************************/

//==============================================================================
// TABLE OF CONTENTS
//==============================================================================
//
// 1. HEADER GUARD & INCLUDES
// 2. LOG LEVEL ENUMERATION
// 3. LOGGER CLASS
//    3.1 Private helpers (timestamp, level names, colors)
//    3.2 Configuration (set_level, set_color, parse_level)
//    3.3 Logging API (log, debug, info, warning, error)
//
//==============================================================================

#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <ctime>

namespace netspeed {

//==============================================================================
// SECTION 2: LOG LEVEL ENUMERATION
//==============================================================================
//
// Ordered by severity. A message is printed when its level is >= the
// configured threshold (default INFO).
//
// DEBUG:   per-segment / per-datagram details, rejected packets
// INFO:    lifecycle events, accepted connections, transfer results
// WARNING: recoverable problems (broadcast failed, discovery timed out)
// ERROR:   a connection or transfer was aborted, startup failed
//

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

//==============================================================================
// SECTION 3: LOGGER CLASS
//==============================================================================

class Logger {
private:
    static LogLevel current_level_;
    static bool color_enabled_;
    static std::mutex mutex_;

    //--------------------------------------------------------------------------
    // 3.1 PRIVATE HELPERS
    //--------------------------------------------------------------------------

    // Format: "YYYY-MM-DD HH:MM:SS.mmm" (local time)
    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        // localtime_r: std::localtime shares a static buffer between threads
        std::tm local_tm;
        localtime_r(&time, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            default:
                return "UNKNOWN";
        }
    }

    // ANSI escape sequences: yellow warnings, red errors
    static const char* level_color(LogLevel level) {
        switch (level) {
            case LogLevel::WARNING:
                return "\033[93m";
            case LogLevel::ERROR:
                return "\033[91m";
            default:
                return "";
        }
    }

public:
    //--------------------------------------------------------------------------
    // 3.2 CONFIGURATION
    //--------------------------------------------------------------------------

    static void set_level(LogLevel level) {
        current_level_ = level;
    }

    static LogLevel get_level() {
        return current_level_;
    }

    static void set_color(bool enabled) {
        color_enabled_ = enabled;
    }

    // Accepts "debug", "info", "warn"/"warning", "error" (case-sensitive,
    // lower case as typed on the command line).
    // Returns false and leaves 'level' untouched for anything else.
    static bool parse_level(const std::string& text, LogLevel& level) {
        if (text == "debug") {
            level = LogLevel::DEBUG;
        } else if (text == "info") {
            level = LogLevel::INFO;
        } else if (text == "warn" || text == "warning") {
            level = LogLevel::WARNING;
        } else if (text == "error") {
            level = LogLevel::ERROR;
        } else {
            return false;
        }
        return true;
    }

    //--------------------------------------------------------------------------
    // 3.3 LOGGING API
    //--------------------------------------------------------------------------

    static void log(LogLevel level, const std::string& message) {
        // Fast path: filtered messages never take the lock
        if (level < current_level_) return;

        std::lock_guard<std::mutex> lock(mutex_);

        const char* color = color_enabled_ ? level_color(level) : "";
        const char* reset = (color[0] != '\0') ? "\033[0m" : "";

        std::cout << color
                  << "[" << get_timestamp() << "] "
                  << "[" << level_to_string(level) << "] "
                  << message << reset << std::endl;
    }

    static void debug(const std::string& message) {
        log(LogLevel::DEBUG, message);
    }

    static void info(const std::string& message) {
        log(LogLevel::INFO, message);
    }

    static void warning(const std::string& message) {
        log(LogLevel::WARNING, message);
    }

    static void error(const std::string& message) {
        log(LogLevel::ERROR, message);
    }
};

} // namespace netspeed

#endif // LOGGER_H
