// JSON payloads exchanged on the em1003/<id>/... topics
#ifndef PAYLOAD_CODEC_HPP
#define PAYLOAD_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/command.hpp>
#include <main/models/telemetry_report.hpp>

namespace PayloadCodec {
    // Accepted shapes:
    //   {"command":"buzzer","state":"on"|"off"}      state omitted = query
    //   {"command":"buzzer_query"}
    //   {"command":"refresh"}
    //   {"command":"set_poll_interval","seconds":120}
    //   {"command":"set_disconnect_policy","policy":"eager"|"keep_alive"}
    // Any of them may carry "id":"..." which is echoed in the ack.
    bool parseCommand(const char* json, int length, Command& out);

    // Return bytes written (excluding NUL), or -1 if the buffer was too small
    int formatTelemetry(const TelemetryReport& report, const char* timestamp, char* out, size_t out_size);
    int formatStatus(const TelemetryReport& report, const char* device_name, uint32_t uptime_ms,
                     char* out, size_t out_size);
    int formatAck(const Command& cmd, bool ok, const char* detail, const char* timestamp,
                  char* out, size_t out_size);

    const char* commandName(CommandType type);
}

#endif // PAYLOAD_CODEC_HPP
