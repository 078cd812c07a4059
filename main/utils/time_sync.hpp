// SNTP time sync helper with ISO-8601 timestamp formatting for telemetry.
#ifndef TIME_SYNC_HPP
#define TIME_SYNC_HPP

#include <cstddef>
#include <cstdint>

namespace TimeSync {
    // Initialize SNTP once (idempotent). Safe to call repeatedly.
    void init();

    // Returns true if system time is considered valid (SNTP synced or RTC set).
    bool isSynced();

    // Block until time is synced or timeout_ms elapses. Returns true if synced.
    bool waitForSync(uint32_t timeout_ms);

    // Seconds since the Unix epoch, or 0 while unsynced.
    uint32_t epochSeconds();

    // "2026-10-19T08:15:00Z" (20 chars, UTC). Writes an empty string while
    // unsynced so callers can omit the field. Always null-terminates when out_size > 0.
    void formatIsoTimestamp(char* out, std::size_t out_size);
}

#endif // TIME_SYNC_HPP
