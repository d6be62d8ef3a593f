/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: logger.cpp

    Description:
        Static member definitions for the Logger class. Compiled exactly once
        into netspeed_lib so the server, the client and every test program
        share a single logging configuration.

    Related Files:
        - common/logger.h: Logger class declaration and interface

*******************************************************************************/

#include "common/logger.h"

namespace netspeed {

//==============================================================================
// STATIC MEMBER INITIALIZATION
//==============================================================================

// INFO by default: lifecycle events and per-transfer results are shown,
// per-datagram DEBUG noise is not.
LogLevel Logger::current_level_ = LogLevel::INFO;

// Off by default; the executables enable it when stdout is a terminal so
// redirected logs stay free of escape sequences.
bool Logger::color_enabled_ = false;

std::mutex Logger::mutex_;

} // namespace netspeed
