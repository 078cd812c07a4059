#ifndef TELEMETRY_REPORT_HPP
#define TELEMETRY_REPORT_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/sensor_descriptor.hpp>

// Per-sensor view after the last-valid cache is applied
struct TelemetryEntry {
    uint8_t  sensor_id;
    bool     available;  // fresh value, or cached value younger than the stale limit
    bool     fresh;      // value came from this cycle
    float    value;
    uint32_t age_ms;     // age of the value (0 when fresh)
};

// One poll cycle as published to em1003/<id>/telemetry
struct TelemetryReport {
    TelemetryEntry entries[MAX_SENSORS];
    size_t         count;
    size_t         valid_count;   // fresh values this cycle
    bool           update_ok;     // false when the cycle produced no value at all
    bool           buzzer_known;
    bool           buzzer_on;
    uint32_t       cycle;
    uint32_t       ts_ms;
    char           breaker[48];   // circuit breaker description
    char           device_name[32];
};

#endif // TELEMETRY_REPORT_HPP
