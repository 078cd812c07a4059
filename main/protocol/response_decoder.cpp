#include <main/protocol/response_decoder.hpp>
#include <main/protocol/em1003_protocol.hpp>
#include <main/protocol/sensor_table.hpp>

namespace ResponseDecoder {
    DecodeStatus decode(const uint8_t* frame, size_t length, ParsedResponse& out) {
        out = ParsedResponse{};
        if (frame == nullptr || length < Em1003Protocol::HEADER_LEN) {
            return DecodeStatus::FRAME_TOO_SHORT;
        }
        out.seq = frame[0];
        out.command = frame[1];
        out.target = frame[2];

        const uint8_t* payload = frame + Em1003Protocol::HEADER_LEN;
        const size_t payload_len = length - Em1003Protocol::HEADER_LEN;

        if (out.command == Em1003Protocol::CMD_BUZZER) {
            if (payload_len < 1) {
                return DecodeStatus::INSUFFICIENT_DATA;
            }
            out.has_value = true;
            out.buzzer_on = payload[0] == Em1003Protocol::BUZZER_ON;
            return DecodeStatus::OK;
        }

        if (payload_len < 2) {
            return DecodeStatus::INSUFFICIENT_DATA;
        }
        out.raw = static_cast<uint16_t>(payload[0] | (payload[1] << 8));
        out.value = SensorTable::convert(out.target, out.raw);
        out.has_value = true;
        return DecodeStatus::OK;
    }

    const char* statusName(DecodeStatus status) {
        switch (status) {
            case DecodeStatus::OK:                return "OK";
            case DecodeStatus::FRAME_TOO_SHORT:   return "FRAME_TOO_SHORT";
            case DecodeStatus::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
            default:                              return "UNKNOWN";
        }
    }
}
