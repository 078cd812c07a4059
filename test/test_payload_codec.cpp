/// @file test_payload_codec.cpp
/// @brief MQTT command parsing and telemetry/ack rendering

#include <unity.h>
#include <cstdlib>
#include <cstring>
#include <mjson.h>
#include <main/network/payload_codec.hpp>
#include <main/session/connection_session.hpp>

namespace {
    bool parse(const char* json, Command& out) {
        return PayloadCodec::parseCommand(json, static_cast<int>(std::strlen(json)), out);
    }
}

void setUp() {}
void tearDown() {}

void test_parse_buzzer_commands() {
    Command cmd{};
    TEST_ASSERT_TRUE(parse("{\"command\":\"buzzer\",\"state\":\"on\",\"id\":\"r1\"}", cmd));
    TEST_ASSERT_EQUAL(CommandType::BUZZER_ON, cmd.type);
    TEST_ASSERT_EQUAL_STRING("r1", cmd.request_id);

    TEST_ASSERT_TRUE(parse("{\"command\":\"buzzer\",\"state\":\"off\"}", cmd));
    TEST_ASSERT_EQUAL(CommandType::BUZZER_OFF, cmd.type);
    TEST_ASSERT_EQUAL_STRING("", cmd.request_id);

    TEST_ASSERT_TRUE(parse("{\"command\":\"buzzer\"}", cmd));
    TEST_ASSERT_EQUAL(CommandType::BUZZER_QUERY, cmd.type);

    TEST_ASSERT_FALSE(parse("{\"command\":\"buzzer\",\"state\":\"loud\"}", cmd));
}

void test_parse_settings_commands() {
    Command cmd{};
    TEST_ASSERT_TRUE(parse("{\"command\":\"set_poll_interval\",\"seconds\":120}", cmd));
    TEST_ASSERT_EQUAL(CommandType::SET_POLL_INTERVAL, cmd.type);
    TEST_ASSERT_EQUAL_INT32(120, cmd.value);

    TEST_ASSERT_FALSE(parse("{\"command\":\"set_poll_interval\"}", cmd));
    TEST_ASSERT_FALSE(parse("{\"command\":\"set_poll_interval\",\"seconds\":0}", cmd));

    TEST_ASSERT_TRUE(parse("{\"command\":\"set_disconnect_policy\",\"policy\":\"keep_alive\"}", cmd));
    TEST_ASSERT_EQUAL(CommandType::SET_DISCONNECT_POLICY, cmd.type);
    TEST_ASSERT_EQUAL_INT32(static_cast<int32_t>(DisconnectPolicy::KEEP_ALIVE), cmd.value);
}

void test_parse_rejects_garbage() {
    Command cmd{};
    TEST_ASSERT_TRUE(parse("{\"command\":\"refresh\"}", cmd));
    TEST_ASSERT_EQUAL(CommandType::REFRESH, cmd.type);
    TEST_ASSERT_FALSE(parse("{\"cmd\":\"refresh\"}", cmd));
    TEST_ASSERT_FALSE(parse("{\"command\":\"reboot\"}", cmd));
    TEST_ASSERT_FALSE(parse("not json", cmd));
}

void test_format_telemetry() {
    TelemetryReport report{};
    report.count = 2;
    report.entries[0] = TelemetryEntry{0x01, true, true, 21.456f, 0};
    report.entries[1] = TelemetryEntry{0x08, true, false, 12.0f, 60000};
    report.valid_count = 1;
    report.update_ok = true;
    report.cycle = 7;

    char out[512];
    const int n = PayloadCodec::formatTelemetry(report, "2026-10-19T08:15:00Z", out, sizeof(out));
    TEST_ASSERT_GREATER_THAN(0, n);
    TEST_ASSERT_NOT_NULL(std::strstr(out, "\"temperature\":21.46"));
    TEST_ASSERT_NOT_NULL(std::strstr(out, "\"pm25\":12"));
    TEST_ASSERT_NOT_NULL(std::strstr(out, "\"cached\":[\"pm25\"]"));
    TEST_ASSERT_NOT_NULL(std::strstr(out, "\"buzzer\":null"));
    TEST_ASSERT_NOT_NULL(std::strstr(out, "\"cycle\":7"));

    double temperature = 0.0;
    TEST_ASSERT_EQUAL_INT(1, mjson_get_number(out, n, "$.sensors.temperature", &temperature));
    TEST_ASSERT_FLOAT_WITHIN(0.001, 21.46, temperature);
}

void test_format_telemetry_unavailable_sensor() {
    TelemetryReport report{};
    report.count = 1;
    report.entries[0] = TelemetryEntry{0x0A, false, false, 0.0f, 0};
    report.buzzer_known = true;
    report.buzzer_on = true;

    char out[512];
    TEST_ASSERT_GREATER_THAN(0, PayloadCodec::formatTelemetry(report, "", out, sizeof(out)));
    TEST_ASSERT_NOT_NULL(std::strstr(out, "\"formaldehyde\":null"));
    TEST_ASSERT_NOT_NULL(std::strstr(out, "\"buzzer\":\"on\""));
    TEST_ASSERT_NOT_NULL(std::strstr(out, "\"ok\":false"));
}

void test_format_rejects_small_buffer() {
    TelemetryReport report{};
    char out[16];
    TEST_ASSERT_EQUAL_INT(-1, PayloadCodec::formatTelemetry(report, "", out, sizeof(out)));
}

void test_format_ack() {
    Command cmd{};
    cmd.type = CommandType::SET_POLL_INTERVAL;
    std::strcpy(cmd.request_id, "abc");

    char out[256];
    const int n = PayloadCodec::formatAck(cmd, true, "poll interval 120 s", "", out, sizeof(out));
    TEST_ASSERT_GREATER_THAN(0, n);
    TEST_ASSERT_NOT_NULL(std::strstr(out, "\"id\":\"abc\""));
    TEST_ASSERT_NOT_NULL(std::strstr(out, "\"command\":\"set_poll_interval\""));
    TEST_ASSERT_NOT_NULL(std::strstr(out, "\"ok\":true"));
}

extern "C" void app_main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_parse_buzzer_commands);
    RUN_TEST(test_parse_settings_commands);
    RUN_TEST(test_parse_rejects_garbage);
    RUN_TEST(test_format_telemetry);
    RUN_TEST(test_format_telemetry_unavailable_sensor);
    RUN_TEST(test_format_rejects_small_buffer);
    RUN_TEST(test_format_ack);
    std::exit(UNITY_END());
}
