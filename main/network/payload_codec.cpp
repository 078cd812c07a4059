#include <main/network/payload_codec.hpp>
#include <main/protocol/sensor_table.hpp>
#include <main/session/connection_session.hpp>
#include <mjson.h>
#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace {
    // Appends with snprintf semantics; false once the buffer is exhausted
    bool append(char* out, size_t out_size, size_t& off, const char* fmt, ...) __attribute__((format(printf, 4, 5)));

    bool append(char* out, size_t out_size, size_t& off, const char* fmt, ...) {
        if (off >= out_size) {
            return false;
        }
        va_list args;
        va_start(args, fmt);
        int n = std::vsnprintf(out + off, out_size - off, fmt, args);
        va_end(args);
        if (n < 0 || static_cast<size_t>(n) >= out_size - off) {
            off = out_size;
            return false;
        }
        off += static_cast<size_t>(n);
        return true;
    }

    // mjson_snprintf truncates silently, so a completely filled buffer counts as overflow
    int finish(int n, size_t out_size) {
        return (n < 0 || static_cast<size_t>(n) + 1 >= out_size) ? -1 : n;
    }
}

namespace PayloadCodec {
    bool parseCommand(const char* json, int length, Command& out) {
        if (json == nullptr || length <= 0) {
            return false;
        }
        char name[32];
        if (mjson_get_string(json, length, "$.command", name, sizeof(name)) <= 0) {
            return false;
        }

        out = Command{};
        if (mjson_get_string(json, length, "$.id", out.request_id, sizeof(out.request_id)) <= 0) {
            out.request_id[0] = '\0';
        }

        if (std::strcmp(name, "buzzer") == 0) {
            char state[12];
            if (mjson_get_string(json, length, "$.state", state, sizeof(state)) <= 0) {
                out.type = CommandType::BUZZER_QUERY;
            } else if (std::strcmp(state, "on") == 0) {
                out.type = CommandType::BUZZER_ON;
            } else if (std::strcmp(state, "off") == 0) {
                out.type = CommandType::BUZZER_OFF;
            } else {
                return false;
            }
            return true;
        }
        if (std::strcmp(name, "buzzer_query") == 0) {
            out.type = CommandType::BUZZER_QUERY;
            return true;
        }
        if (std::strcmp(name, "refresh") == 0) {
            out.type = CommandType::REFRESH;
            return true;
        }
        if (std::strcmp(name, "set_poll_interval") == 0) {
            double seconds = 0.0;
            if (mjson_get_number(json, length, "$.seconds", &seconds) != 1 || seconds < 1.0 || seconds > 86400.0) {
                return false;
            }
            out.type = CommandType::SET_POLL_INTERVAL;
            out.value = static_cast<int32_t>(seconds);
            return true;
        }
        if (std::strcmp(name, "set_disconnect_policy") == 0) {
            char policy[16];
            if (mjson_get_string(json, length, "$.policy", policy, sizeof(policy)) <= 0) {
                return false;
            }
            out.type = CommandType::SET_DISCONNECT_POLICY;
            if (std::strcmp(policy, "eager") == 0) {
                out.value = static_cast<int32_t>(DisconnectPolicy::EAGER);
            } else if (std::strcmp(policy, "keep_alive") == 0) {
                out.value = static_cast<int32_t>(DisconnectPolicy::KEEP_ALIVE);
            } else {
                return false;
            }
            return true;
        }
        return false;
    }

    int formatTelemetry(const TelemetryReport& report, const char* timestamp, char* out, size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return -1;
        }
        // Values rendered with each sensor's precision; null when unavailable
        char sensors[384];
        char cached[128];
        size_t s_off = 0;
        size_t c_off = 0;
        sensors[0] = '\0';
        cached[0] = '\0';
        bool ok = true;
        for (size_t i = 0; i < report.count; ++i) {
            const TelemetryEntry& entry = report.entries[i];
            const SensorDescriptor* d = SensorTable::find(entry.sensor_id);
            const char* key = d != nullptr ? d->key : "unknown";
            const char* sep = (s_off == 0) ? "" : ",";
            if (entry.available) {
                ok = ok && append(sensors, sizeof(sensors), s_off, "%s\"%s\":%.*f", sep, key,
                                  d != nullptr ? static_cast<int>(d->precision) : 0,
                                  static_cast<double>(entry.value));
                if (!entry.fresh) {
                    ok = ok && append(cached, sizeof(cached), c_off, "%s\"%s\"", c_off == 0 ? "" : ",", key);
                }
            } else {
                ok = ok && append(sensors, sizeof(sensors), s_off, "%s\"%s\":null", sep, key);
            }
        }
        if (!ok) {
            return -1;
        }

        int n = mjson_snprintf(out, out_size,
                               "{%Q:{%s},%Q:[%s],%Q:%B,%Q:%d,%Q:%d,%Q:%s,%Q:%Q}",
                               "sensors", sensors,
                               "cached", cached,
                               "ok", report.update_ok ? 1 : 0,
                               "valid", static_cast<int>(report.valid_count),
                               "cycle", static_cast<int>(report.cycle),
                               "buzzer", !report.buzzer_known ? "null" : (report.buzzer_on ? "\"on\"" : "\"off\""),
                               "ts", timestamp != nullptr ? timestamp : "");
        return finish(n, out_size);
    }

    int formatStatus(const TelemetryReport& report, const char* device_name, uint32_t uptime_ms,
                     char* out, size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return -1;
        }
        int n = mjson_snprintf(out, out_size,
                               "{%Q:%Q,%Q:%Q,%Q:%Q,%Q:%d,%Q:%d,%Q:%B}",
                               "status", "online",
                               "device", device_name != nullptr ? device_name : "",
                               "breaker", report.breaker,
                               "uptime_s", static_cast<int>(uptime_ms / 1000),
                               "cycle", static_cast<int>(report.cycle),
                               "last_ok", report.update_ok ? 1 : 0);
        return finish(n, out_size);
    }

    int formatAck(const Command& cmd, bool ok, const char* detail, const char* timestamp,
                  char* out, size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return -1;
        }
        int n = mjson_snprintf(out, out_size,
                               "{%Q:%Q,%Q:%Q,%Q:%B,%Q:%Q,%Q:%Q}",
                               "id", cmd.request_id,
                               "command", commandName(cmd.type),
                               "ok", ok ? 1 : 0,
                               "detail", detail != nullptr ? detail : "",
                               "ts", timestamp != nullptr ? timestamp : "");
        return finish(n, out_size);
    }

    const char* commandName(CommandType type) {
        switch (type) {
            case CommandType::BUZZER_ON:             return "buzzer_on";
            case CommandType::BUZZER_OFF:            return "buzzer_off";
            case CommandType::BUZZER_QUERY:          return "buzzer_query";
            case CommandType::REFRESH:               return "refresh";
            case CommandType::SET_POLL_INTERVAL:     return "set_poll_interval";
            case CommandType::SET_DISCONNECT_POLICY: return "set_disconnect_policy";
            default:                                 return "unknown";
        }
    }
}
