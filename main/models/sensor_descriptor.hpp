#ifndef SENSOR_DESCRIPTOR_HPP
#define SENSOR_DESCRIPTOR_HPP

#include <cstddef>
#include <cstdint>

// Number of sensors the EM1003 exposes; sizes every per-sensor array
static constexpr size_t MAX_SENSORS = 8;

// How a raw u16 reading becomes an engineering value
enum class ValueTransform : uint8_t {
    DIRECT = 0,        // raw
    SCALE = 1,         // raw / divisor
    OFFSET_SCALE = 2   // (raw - offset) / divisor
};

// Immutable description of one sensor channel
struct SensorDescriptor {
    uint8_t        id;        // target byte on the wire
    const char*    name;      // display name
    const char*    key;       // JSON key in telemetry
    const char*    unit;
    ValueTransform transform;
    int32_t        offset;
    float          divisor;
    uint8_t        precision; // decimal places when rendered
};

#endif // SENSOR_DESCRIPTOR_HPP
