#ifndef SENSOR_SNAPSHOT_HPP
#define SENSOR_SNAPSHOT_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/sensor_descriptor.hpp>

enum class ReadingState : uint8_t {
    NOT_REQUESTED = 0,
    NO_DATA = 1,
    VALUE = 2
};

struct SensorReading {
    uint8_t      sensor_id;
    ReadingState state;
    float        value;   // valid only when state == VALUE
};

// Result of one full read cycle, one entry per configured sensor
struct SensorSnapshot {
    SensorReading readings[MAX_SENSORS];
    size_t        count;
    uint32_t      ts_ms;  // cycle completion time in milliseconds

    SensorReading* find(uint8_t sensor_id) {
        for (size_t i = 0; i < count; ++i) {
            if (readings[i].sensor_id == sensor_id) {
                return &readings[i];
            }
        }
        return nullptr;
    }

    const SensorReading* find(uint8_t sensor_id) const {
        return const_cast<SensorSnapshot*>(this)->find(sensor_id);
    }

    size_t valueCount() const {
        size_t n = 0;
        for (size_t i = 0; i < count; ++i) {
            if (readings[i].state == ReadingState::VALUE) {
                ++n;
            }
        }
        return n;
    }
};

#endif // SENSOR_SNAPSHOT_HPP
