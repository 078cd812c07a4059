#ifndef SENSOR_TABLE_HPP
#define SENSOR_TABLE_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/sensor_descriptor.hpp>

// Compiled-in EM1003 sensor catalogue, in polling order
namespace SensorTable {
    size_t count();
    const SensorDescriptor& at(size_t index);

    // nullptr for ids outside the table
    const SensorDescriptor* find(uint8_t sensor_id);

    // Apply the descriptor's transform; unknown ids pass the raw value through
    float convert(uint8_t sensor_id, uint16_t raw);
    float apply(const SensorDescriptor& descriptor, uint16_t raw);
}

#endif // SENSOR_TABLE_HPP
