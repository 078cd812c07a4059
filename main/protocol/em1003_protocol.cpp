#include <main/protocol/em1003_protocol.hpp>
#include <cstring>

namespace Em1003Protocol {
    size_t encodeRequest(uint8_t seq, uint8_t command, uint8_t target,
                         const uint8_t* payload, size_t payload_len,
                         uint8_t* out, size_t out_size) {
        const size_t total = HEADER_LEN + payload_len;
        if (out == nullptr || out_size < total || total > MAX_REQUEST_LEN) {
            return 0;
        }
        out[0] = seq;
        out[1] = command;
        out[2] = target;
        if (payload_len > 0) {
            std::memcpy(out + HEADER_LEN, payload, payload_len);
        }
        return total;
    }

    size_t encodeSensorRead(uint8_t seq, uint8_t sensor_id, uint8_t* out, size_t out_size) {
        return encodeRequest(seq, CMD_READ_SENSOR, sensor_id, nullptr, 0, out, out_size);
    }

    size_t encodeBuzzerQuery(uint8_t seq, uint8_t* out, size_t out_size) {
        return encodeRequest(seq, CMD_BUZZER, BUZZER_TARGET, nullptr, 0, out, out_size);
    }

    size_t encodeBuzzerSet(uint8_t seq, bool on, uint8_t* out, size_t out_size) {
        const uint8_t state = on ? BUZZER_ON : BUZZER_OFF;
        return encodeRequest(seq, CMD_BUZZER, BUZZER_TARGET, &state, 1, out, out_size);
    }

    const char* commandName(uint8_t command) {
        switch (command) {
            case CMD_READ_SENSOR: return "READ_SENSOR";
            case CMD_BUZZER:      return "BUZZER";
            default:              return "UNKNOWN";
        }
    }
}
