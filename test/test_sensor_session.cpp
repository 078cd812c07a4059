/// @file test_sensor_session.cpp
/// @brief End-to-end protocol operations against the fake transport

#include <unity.h>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <main/protocol/sensor_table.hpp>
#include <main/session/sensor_session.hpp>
#include "support/fake_ble_transport.hpp"
#include "support/fake_clock.hpp"

namespace {
    const char* kAddress = "AA:BB:CC:DD:EE:FF";

    uint32_t g_seq = 0;
    uint32_t nextSeq() { return g_seq++; }

    SessionOptions testOptions() {
        SessionOptions options;
        options.response_timeout_ms = 50;
        options.lock_timeout_ms = 1000;
        return options;
    }

    // Trips the breaker by failing three connection attempts
    void openBreaker(FakeTransport& transport, FakeClock& clock, SensorSession& session) {
        transport.device_present = false;
        SensorSnapshot snapshot{};
        for (int i = 0; i < 3; ++i) {
            TEST_ASSERT_EQUAL(ReadResult::CONNECTION_FAILED, session.readAllSensors(snapshot));
            clock.advance(1000);
        }
        TEST_ASSERT_EQUAL(CircuitBreaker::State::OPEN, session.breaker().state());
    }
}

void setUp() {
    g_seq = 0;
}
void tearDown() {}

void test_read_single_sensor() {
    FakeTransport transport;
    FakeClock clock;
    transport.raw_values[0x01] = 49;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    float value = 0.0f;
    TEST_ASSERT_TRUE(session.readSensor(0x01, value));
    TEST_ASSERT_FLOAT_WITHIN(0.001f, -39.51f, value);
    TEST_ASSERT_EQUAL_HEX8(0x06, transport.last_request[1]);
    TEST_ASSERT_EQUAL_HEX8(0x01, transport.last_request[2]);
    TEST_ASSERT_EQUAL_UINT(0, session.pendingRequests().size());
    TEST_ASSERT_EQUAL_UINT(0, session.sequenceIds().inUseCount());
    TEST_ASSERT_EQUAL_UINT32(0, session.breaker().failureCount());
}

void test_read_all_sensors() {
    FakeTransport transport;
    FakeClock clock;
    transport.raw_values[0x06] = 4550;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    SensorSnapshot snapshot{};
    TEST_ASSERT_EQUAL(ReadResult::COMPLETED, session.readAllSensors(snapshot));
    TEST_ASSERT_EQUAL_UINT(SensorTable::count(), snapshot.count);
    TEST_ASSERT_EQUAL_UINT(SensorTable::count(), snapshot.valueCount());
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 45.5f, snapshot.find(0x06)->value);
    TEST_ASSERT_EQUAL_INT(static_cast<int>(SensorTable::count()), transport.writes);
    // Pacing between requests, none after the last one
    TEST_ASSERT_EQUAL_UINT32((SensorTable::count() - 1) * Config::Session::batch_pacing_ms, clock.total_slept_ms);
}

void test_eager_policy_disconnects_after_batch() {
    FakeTransport transport;
    FakeClock clock;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    SensorSnapshot snapshot{};
    TEST_ASSERT_EQUAL(ReadResult::COMPLETED, session.readAllSensors(snapshot));
    TEST_ASSERT_EQUAL_INT(1, transport.disconnect_calls);
    TEST_ASSERT_FALSE(session.connection().isConnected());
}

void test_keep_alive_policy_reuses_link() {
    FakeTransport transport;
    FakeClock clock;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);
    session.setDisconnectPolicy(DisconnectPolicy::KEEP_ALIVE);

    SensorSnapshot snapshot{};
    TEST_ASSERT_EQUAL(ReadResult::COMPLETED, session.readAllSensors(snapshot));
    TEST_ASSERT_EQUAL(ReadResult::COMPLETED, session.readAllSensors(snapshot));
    TEST_ASSERT_EQUAL_INT(1, transport.connect_calls);
    TEST_ASSERT_EQUAL_INT(0, transport.disconnect_calls);
    TEST_ASSERT_TRUE(session.connection().isConnected());
}

void test_open_breaker_blocks_without_io() {
    FakeTransport transport;
    FakeClock clock;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);
    openBreaker(transport, clock, session);

    transport.device_present = true;
    transport.resetCounters();
    SensorSnapshot snapshot{};
    TEST_ASSERT_EQUAL(ReadResult::BLOCKED, session.readAllSensors(snapshot));
    for (size_t i = 0; i < snapshot.count; ++i) {
        TEST_ASSERT_EQUAL(ReadingState::NO_DATA, snapshot.readings[i].state);
    }
    TEST_ASSERT_EQUAL_INT(0, transport.transportCalls());

    float value = 0.0f;
    TEST_ASSERT_FALSE(session.readSensor(0x01, value));
    TEST_ASSERT_EQUAL_INT(0, transport.transportCalls());
}

void test_half_open_trial_closes_breaker() {
    FakeTransport transport;
    FakeClock clock;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);
    openBreaker(transport, clock, session);

    transport.device_present = true;
    clock.advance(Config::Breaker::base_open_ms);
    SensorSnapshot snapshot{};
    TEST_ASSERT_EQUAL(ReadResult::COMPLETED, session.readAllSensors(snapshot));
    TEST_ASSERT_EQUAL(CircuitBreaker::State::CLOSED, session.breaker().state());
    TEST_ASSERT_EQUAL_UINT(SensorTable::count(), snapshot.valueCount());
}

void test_link_drop_mid_batch() {
    FakeTransport transport;
    FakeClock clock;
    transport.drop_after_responses = 3;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    SensorSnapshot snapshot{};
    TEST_ASSERT_EQUAL(ReadResult::COMPLETED, session.readAllSensors(snapshot));
    for (size_t i = 0; i < 3; ++i) {
        TEST_ASSERT_EQUAL(ReadingState::VALUE, snapshot.readings[i].state);
    }
    for (size_t i = 3; i < snapshot.count; ++i) {
        TEST_ASSERT_EQUAL(ReadingState::NO_DATA, snapshot.readings[i].state);
    }
    TEST_ASSERT_EQUAL_UINT32(1, session.breaker().failureCount());
    TEST_ASSERT_FALSE(session.connection().isConnected());
    TEST_ASSERT_EQUAL_UINT(0, session.pendingRequests().size());
    TEST_ASSERT_EQUAL_UINT(0, session.sequenceIds().inUseCount());
}

void test_response_timeout_releases_request() {
    FakeTransport transport;
    FakeClock clock;
    transport.silent[0x01] = true;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    float value = 0.0f;
    TEST_ASSERT_FALSE(session.readSensor(0x01, value));
    TEST_ASSERT_EQUAL_UINT(0, session.pendingRequests().size());
    TEST_ASSERT_EQUAL_UINT(0, session.sequenceIds().inUseCount());
    TEST_ASSERT_EQUAL_UINT32(1, session.breaker().failureCount());
}

void test_one_silent_sensor_still_succeeds() {
    FakeTransport transport;
    FakeClock clock;
    transport.silent[0x09] = true;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    SensorSnapshot snapshot{};
    TEST_ASSERT_EQUAL(ReadResult::COMPLETED, session.readAllSensors(snapshot));
    TEST_ASSERT_EQUAL(ReadingState::NO_DATA, snapshot.find(0x09)->state);
    TEST_ASSERT_EQUAL_UINT(SensorTable::count() - 1, snapshot.valueCount());
    TEST_ASSERT_EQUAL_UINT32(0, session.breaker().failureCount());
}

void test_short_reply_yields_no_value() {
    FakeTransport transport;
    FakeClock clock;
    transport.short_reply[0x01] = true;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    float value = 0.0f;
    TEST_ASSERT_FALSE(session.readSensor(0x01, value));
    // The device answered, so the link is healthy
    TEST_ASSERT_EQUAL_UINT32(0, session.breaker().failureCount());
    TEST_ASSERT_EQUAL_UINT(0, session.pendingRequests().size());
}

void test_malformed_frames_are_discarded() {
    FakeTransport transport;
    FakeClock clock;
    transport.garbage_before_reply = true;
    transport.raw_values[0x13] = 612;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    float value = 0.0f;
    TEST_ASSERT_TRUE(session.readSensor(0x13, value));
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 612.0f, value);
    TEST_ASSERT_EQUAL_UINT32(1, session.malformedFrames());
}

void test_buzzer_set_and_read() {
    FakeTransport transport;
    FakeClock clock;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    TEST_ASSERT_TRUE(session.setBuzzerState(true));
    TEST_ASSERT_EQUAL_UINT(4, transport.last_request_len);
    TEST_ASSERT_EQUAL_HEX8(0x50, transport.last_request[1]);
    TEST_ASSERT_EQUAL_HEX8(0x01, transport.last_request[3]);

    bool on = false;
    TEST_ASSERT_TRUE(session.readBuzzerState(on));
    TEST_ASSERT_TRUE(on);
    TEST_ASSERT_EQUAL_UINT(3, transport.last_request_len);

    TEST_ASSERT_TRUE(session.setBuzzerState(false));
    TEST_ASSERT_FALSE(transport.buzzer_on);
}

void test_buzzer_set_not_confirmed() {
    FakeTransport transport;
    FakeClock clock;
    transport.buzzer_ignores_set = true;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    TEST_ASSERT_FALSE(session.setBuzzerState(true));
    TEST_ASSERT_EQUAL_UINT32(0, session.breaker().failureCount());
}

void test_read_device_name() {
    FakeTransport transport;
    FakeClock clock;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    char name[32];
    TEST_ASSERT_TRUE(session.readDeviceName(name, sizeof(name)));
    TEST_ASSERT_EQUAL_STRING("EM1003-A1B2", name);

    char tiny[5];
    TEST_ASSERT_TRUE(session.readDeviceName(tiny, sizeof(tiny)));
    TEST_ASSERT_EQUAL_STRING("EM10", tiny);
}

void test_connection_failure_counts_once() {
    FakeTransport transport;
    FakeClock clock;
    transport.connect_status = TransportStatus::TIMEOUT;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    float value = 0.0f;
    TEST_ASSERT_FALSE(session.readSensor(0x01, value));
    TEST_ASSERT_EQUAL_UINT32(1, session.breaker().failureCount());
    TEST_ASSERT_EQUAL_INT(0, transport.writes);
}

void test_explicit_disconnect() {
    FakeTransport transport;
    FakeClock clock;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    bool on = false;
    TEST_ASSERT_TRUE(session.readBuzzerState(on));
    TEST_ASSERT_TRUE(session.connection().isConnected());
    session.disconnect();
    TEST_ASSERT_FALSE(session.connection().isConnected());
    TEST_ASSERT_EQUAL_INT(1, transport.disconnect_calls);
}

void test_write_error_discards_link() {
    FakeTransport transport;
    FakeClock clock;
    transport.write_error = true;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    float value = 0.0f;
    TEST_ASSERT_FALSE(session.readSensor(0x01, value));
    TEST_ASSERT_EQUAL_INT(1, transport.disconnect_calls);
    TEST_ASSERT_FALSE(session.connection().isConnected());
    TEST_ASSERT_EQUAL_UINT32(1, session.breaker().failureCount());
    TEST_ASSERT_EQUAL_UINT(0, session.pendingRequests().size());
    TEST_ASSERT_EQUAL_UINT(0, session.sequenceIds().inUseCount());

    // The next operation must open a fresh link instead of reusing the broken one
    transport.write_error = false;
    transport.raw_values[0x01] = 49;
    TEST_ASSERT_TRUE(session.readSensor(0x01, value));
    TEST_ASSERT_FLOAT_WITHIN(0.001f, -39.51f, value);
    TEST_ASSERT_EQUAL_INT(2, transport.connect_calls);
}

void test_write_error_aborts_batch() {
    FakeTransport transport;
    FakeClock clock;
    transport.write_error = true;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    SensorSnapshot snapshot{};
    TEST_ASSERT_EQUAL(ReadResult::COMPLETED, session.readAllSensors(snapshot));
    TEST_ASSERT_EQUAL_UINT(0, snapshot.valueCount());
    for (size_t i = 0; i < snapshot.count; ++i) {
        TEST_ASSERT_EQUAL(ReadingState::NO_DATA, snapshot.readings[i].state);
    }
    TEST_ASSERT_EQUAL_INT(1, transport.writes);
    TEST_ASSERT_EQUAL_INT(1, transport.disconnect_calls);
    TEST_ASSERT_EQUAL_UINT32(1, session.breaker().failureCount());
    TEST_ASSERT_EQUAL_UINT32(0, clock.total_slept_ms);
}

void test_device_name_read_failure_discards_link() {
    FakeTransport transport;
    FakeClock clock;
    transport.name_read_fails = true;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    char name[32];
    TEST_ASSERT_FALSE(session.readDeviceName(name, sizeof(name)));
    TEST_ASSERT_EQUAL_STRING("", name);
    TEST_ASSERT_EQUAL_INT(1, transport.disconnect_calls);
    TEST_ASSERT_FALSE(session.connection().isConnected());

    transport.name_read_fails = false;
    TEST_ASSERT_TRUE(session.readDeviceName(name, sizeof(name)));
    TEST_ASSERT_EQUAL_INT(2, transport.connect_calls);
}

void test_wrong_sequence_reply_is_unmatched() {
    FakeTransport transport;
    FakeClock clock;
    transport.wrong_seq_reply = true;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    float value = 0.0f;
    TEST_ASSERT_FALSE(session.readSensor(0x01, value));
    TEST_ASSERT_EQUAL_UINT32(1, session.unmatchedFrames());
    TEST_ASSERT_EQUAL_UINT(0, session.pendingRequests().size());
    TEST_ASSERT_EQUAL_UINT(0, session.sequenceIds().inUseCount());
    TEST_ASSERT_EQUAL_UINT32(1, session.breaker().failureCount());

    transport.wrong_seq_reply = false;
    transport.raw_values[0x06] = 4550;
    TEST_ASSERT_TRUE(session.readSensor(0x06, value));
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 45.5f, value);
    TEST_ASSERT_EQUAL_UINT32(1, session.unmatchedFrames());
    TEST_ASSERT_EQUAL_UINT32(0, session.breaker().failureCount());
}

void test_late_reply_after_timeout_is_unmatched() {
    FakeTransport transport;
    FakeClock clock;
    transport.silent[0x01] = true;
    transport.late_replies = true;
    transport.raw_values[0x01] = 49;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    float value = 0.0f;
    TEST_ASSERT_FALSE(session.readSensor(0x01, value));
    TEST_ASSERT_EQUAL_UINT32(0, session.unmatchedFrames());

    // The stale reply for the timed-out request arrives ahead of the new one
    transport.silent[0x01] = false;
    TEST_ASSERT_TRUE(session.readSensor(0x01, value));
    TEST_ASSERT_FLOAT_WITHIN(0.001f, -39.51f, value);
    TEST_ASSERT_EQUAL_UINT32(1, session.unmatchedFrames());
    TEST_ASSERT_EQUAL_UINT(0, session.pendingRequests().size());
    TEST_ASSERT_EQUAL_UINT(0, session.sequenceIds().inUseCount());
}

void test_response_deadline_follows_clock() {
    FakeTransport transport;
    FakeClock clock;
    transport.silent[0x01] = true;
    SessionOptions options = testOptions();
    options.response_timeout_ms = 60000;
    SensorSession session(transport, kAddress, clock, options, nextSeq);

    // Session time races ahead, so the wait ends long before 60 s of ticks
    clock.auto_advance_ms = 20000;
    const TickType_t started = xTaskGetTickCount();
    float value = 0.0f;
    TEST_ASSERT_FALSE(session.readSensor(0x01, value));
    TEST_ASSERT_TRUE((xTaskGetTickCount() - started) < pdMS_TO_TICKS(5000));
    TEST_ASSERT_EQUAL_UINT(0, session.pendingRequests().size());
    TEST_ASSERT_EQUAL_UINT32(1, session.breaker().failureCount());
}

void test_breaker_state_reads_under_lock() {
    FakeTransport transport;
    FakeClock clock;
    SensorSession session(transport, kAddress, clock, testOptions(), nextSeq);

    CircuitBreaker::State state = CircuitBreaker::State::OPEN;
    TEST_ASSERT_TRUE(session.breakerState(state));
    TEST_ASSERT_EQUAL(CircuitBreaker::State::CLOSED, state);

    openBreaker(transport, clock, session);
    TEST_ASSERT_TRUE(session.breakerState(state));
    TEST_ASSERT_EQUAL(CircuitBreaker::State::OPEN, state);
}

namespace {
    SensorSession* g_busy_session = nullptr;
    std::atomic<bool> g_busy_done{false};

    void slowReadTask(void* parameters) {
        (void)parameters;
        float value = 0.0f;
        (void)g_busy_session->readSensor(0x01, value);
        g_busy_done.store(true);
        vTaskDelete(nullptr);
    }
}

void test_breaker_state_fails_while_session_busy() {
    FakeTransport transport;
    FakeClock clock;
    transport.silent[0x01] = true;
    SessionOptions options = testOptions();
    options.response_timeout_ms = 500;
    options.lock_timeout_ms = 10;
    SensorSession session(transport, kAddress, clock, options, nextSeq);

    g_busy_session = &session;
    g_busy_done.store(false);
    TEST_ASSERT_EQUAL(pdPASS, xTaskCreate(slowReadTask, "slow_read", 4096, nullptr,
                                          uxTaskPriorityGet(nullptr), nullptr));
    // Let the reader take the lock and block on the silent sensor
    vTaskDelay(pdMS_TO_TICKS(100));
    TEST_ASSERT_FALSE(g_busy_done.load());

    CircuitBreaker::State state = CircuitBreaker::State::HALF_OPEN;
    TEST_ASSERT_FALSE(session.breakerState(state));
    TEST_ASSERT_EQUAL(CircuitBreaker::State::HALF_OPEN, state);

    for (int i = 0; i < 200 && !g_busy_done.load(); ++i) {
        vTaskDelay(pdMS_TO_TICKS(10));
    }
    TEST_ASSERT_TRUE(g_busy_done.load());
    g_busy_session = nullptr;
    TEST_ASSERT_TRUE(session.breakerState(state));
    TEST_ASSERT_EQUAL(CircuitBreaker::State::CLOSED, state);
}

extern "C" void app_main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_read_single_sensor);
    RUN_TEST(test_read_all_sensors);
    RUN_TEST(test_eager_policy_disconnects_after_batch);
    RUN_TEST(test_keep_alive_policy_reuses_link);
    RUN_TEST(test_open_breaker_blocks_without_io);
    RUN_TEST(test_half_open_trial_closes_breaker);
    RUN_TEST(test_link_drop_mid_batch);
    RUN_TEST(test_response_timeout_releases_request);
    RUN_TEST(test_one_silent_sensor_still_succeeds);
    RUN_TEST(test_short_reply_yields_no_value);
    RUN_TEST(test_malformed_frames_are_discarded);
    RUN_TEST(test_buzzer_set_and_read);
    RUN_TEST(test_buzzer_set_not_confirmed);
    RUN_TEST(test_read_device_name);
    RUN_TEST(test_connection_failure_counts_once);
    RUN_TEST(test_explicit_disconnect);
    RUN_TEST(test_write_error_discards_link);
    RUN_TEST(test_write_error_aborts_batch);
    RUN_TEST(test_device_name_read_failure_discards_link);
    RUN_TEST(test_wrong_sequence_reply_is_unmatched);
    RUN_TEST(test_late_reply_after_timeout_is_unmatched);
    RUN_TEST(test_response_deadline_follows_clock);
    RUN_TEST(test_breaker_state_reads_under_lock);
    RUN_TEST(test_breaker_state_fails_while_session_busy);
    std::exit(UNITY_END());
}
