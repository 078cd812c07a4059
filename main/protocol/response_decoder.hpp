#ifndef RESPONSE_DECODER_HPP
#define RESPONSE_DECODER_HPP

#include <cstddef>
#include <cstdint>

enum class DecodeStatus : uint8_t {
    OK = 0,
    FRAME_TOO_SHORT = 1,    // fewer than 3 bytes, header unusable
    INSUFFICIENT_DATA = 2   // header decoded, payload too short for a value
};

// Decoded notification. has_value is false for INSUFFICIENT_DATA frames.
struct ParsedResponse {
    uint8_t  seq;
    uint8_t  command;
    uint8_t  target;
    bool     has_value;
    uint16_t raw;        // sensor responses
    float    value;      // transformed sensor value
    bool     buzzer_on;  // buzzer responses
};

namespace ResponseDecoder {
    DecodeStatus decode(const uint8_t* frame, size_t length, ParsedResponse& out);
    const char* statusName(DecodeStatus status);
}

#endif // RESPONSE_DECODER_HPP
