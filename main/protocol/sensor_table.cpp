#include <main/protocol/sensor_table.hpp>

namespace {
    constexpr SensorDescriptor kSensors[] = {
        { 0x01, "Temperature",  "temperature",  "\xC2\xB0""C",             ValueTransform::OFFSET_SCALE, 4000,  100.0f,  2 },
        { 0x06, "Humidity",     "humidity",     "%",                       ValueTransform::SCALE,        0,     100.0f,  1 },
        { 0x08, "PM2.5",        "pm25",         "\xC2\xB5g/m\xC2\xB3",     ValueTransform::DIRECT,       0,     1.0f,    0 },
        { 0x09, "Noise",        "noise",        "dB",                      ValueTransform::DIRECT,       0,     1.0f,    0 },
        { 0x0A, "Formaldehyde", "formaldehyde", "mg/m\xC2\xB3",            ValueTransform::OFFSET_SCALE, 16384, 1000.0f, 3 },
        { 0x11, "PM10",         "pm10",         "\xC2\xB5g/m\xC2\xB3",     ValueTransform::DIRECT,       0,     1.0f,    0 },
        { 0x12, "TVOC",         "tvoc",         "\xC2\xB5g/m\xC2\xB3",     ValueTransform::DIRECT,       0,     1.0f,    0 },
        { 0x13, "eCO2",         "eco2",         "ppm",                     ValueTransform::DIRECT,       0,     1.0f,    0 },
    };

    constexpr size_t kSensorCount = sizeof(kSensors) / sizeof(kSensors[0]);
    static_assert(kSensorCount == MAX_SENSORS, "MAX_SENSORS must match the sensor table");
}

namespace SensorTable {
    size_t count() {
        return kSensorCount;
    }

    const SensorDescriptor& at(size_t index) {
        return kSensors[index < kSensorCount ? index : kSensorCount - 1];
    }

    const SensorDescriptor* find(uint8_t sensor_id) {
        for (const SensorDescriptor& d : kSensors) {
            if (d.id == sensor_id) {
                return &d;
            }
        }
        return nullptr;
    }

    float apply(const SensorDescriptor& descriptor, uint16_t raw) {
        switch (descriptor.transform) {
            case ValueTransform::OFFSET_SCALE:
                return static_cast<float>(static_cast<int32_t>(raw) - descriptor.offset) / descriptor.divisor;
            case ValueTransform::SCALE:
                return static_cast<float>(raw) / descriptor.divisor;
            case ValueTransform::DIRECT:
            default:
                return static_cast<float>(raw);
        }
    }

    float convert(uint8_t sensor_id, uint16_t raw) {
        const SensorDescriptor* d = find(sensor_id);
        return d != nullptr ? apply(*d, raw) : static_cast<float>(raw);
    }
}
