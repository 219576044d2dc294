#pragma once

#include <chrono>

// ----------------------------------------------------------
// Loop timings (defaults = production values)
// ----------------------------------------------------------
struct Timing
{
    std::chrono::milliseconds retryDelay{1000};      // spacenavd open retry
    std::chrono::milliseconds connectTimeout{5000};  // fixture connect
    std::chrono::milliseconds settleDelay{500};      // after connect, before first command
    std::chrono::milliseconds cooldown{1000};        // after a failed fixture attempt
    std::chrono::milliseconds pollInterval{10};      // both loops
    std::chrono::milliseconds livenessInterval{2000}; // fixture heartbeat while idle
};
