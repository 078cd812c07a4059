// EM1003 request framing. Every frame starts with [seq, command, target];
// responses echo the same three bytes followed by a little-endian payload.
#ifndef EM1003_PROTOCOL_HPP
#define EM1003_PROTOCOL_HPP

#include <cstddef>
#include <cstdint>

namespace Em1003Protocol {
    static constexpr uint8_t CMD_READ_SENSOR = 0x06;
    static constexpr uint8_t CMD_BUZZER = 0x50;

    // Target byte used for buzzer frames
    static constexpr uint8_t BUZZER_TARGET = 0x00;
    static constexpr uint8_t BUZZER_ON = 0x01;
    static constexpr uint8_t BUZZER_OFF = 0x00;

    static constexpr size_t HEADER_LEN = 3;
    static constexpr size_t MAX_REQUEST_LEN = 8;

    // Generic encoder; returns bytes written or 0 if out_size is too small
    size_t encodeRequest(uint8_t seq, uint8_t command, uint8_t target,
                         const uint8_t* payload, size_t payload_len,
                         uint8_t* out, size_t out_size);

    // [seq, 0x06, sensor_id]
    size_t encodeSensorRead(uint8_t seq, uint8_t sensor_id, uint8_t* out, size_t out_size);
    // [seq, 0x50, 0x00]
    size_t encodeBuzzerQuery(uint8_t seq, uint8_t* out, size_t out_size);
    // [seq, 0x50, 0x00, 0x01|0x00]
    size_t encodeBuzzerSet(uint8_t seq, bool on, uint8_t* out, size_t out_size);

    const char* commandName(uint8_t command);
}

#endif // EM1003_PROTOCOL_HPP
