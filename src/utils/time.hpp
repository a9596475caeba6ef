#pragma once
#include <chrono>
#include <cstdint>

/*
------------------------------------------------------------------------------
  CLOCK TYPES
------------------------------------------------------------------------------

  steady_clock → deadlines (key expiry, blocking-pop timeouts).
                 Never jumps backwards, so a deadline computed as
                 now + ttl stays meaningful across NTP adjustments.

  system_clock → wall-clock timestamps used for auto-generated
                 stream IDs ("<unix ms>-<seq>").
------------------------------------------------------------------------------
*/

/**
 * @brief Current monotonic time in milliseconds.
 *
 * Only differences between two calls are meaningful.
 */
inline uint64_t current_time_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
}

/**
 * @brief Current Unix timestamp in milliseconds.
 */
inline uint64_t unix_time_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}
