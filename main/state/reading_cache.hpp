#ifndef READING_CACHE_HPP
#define READING_CACHE_HPP

#include <cstddef>
#include <cstdint>
#include <main/config/config.hpp>
#include <main/models/sensor_descriptor.hpp>
#include <main/models/sensor_snapshot.hpp>
#include <main/models/telemetry_report.hpp>

// Last valid value per sensor. A sensor stays available while this cycle
// produced a value for it, or while its cached value is younger than stale_after_ms.
class ReadingCache {
public:
    explicit ReadingCache(uint32_t stale_after_ms = Config::Tasks::Poll::stale_after_ms);

    // Fold a snapshot into the cache and fill the per-sensor part of report
    void apply(const SensorSnapshot& snapshot, uint32_t now_ms, TelemetryReport& report);

    size_t cachedCount() const;

private:
    struct Slot {
        uint8_t  sensor_id;
        bool     has_value;
        float    value;
        uint32_t updated_ms;
    };

    Slot* slotFor(uint8_t sensor_id);

    uint32_t stale_after_ms;
    Slot slots[MAX_SENSORS];
    size_t used;
};

#endif // READING_CACHE_HPP
