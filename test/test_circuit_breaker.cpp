/// @file test_circuit_breaker.cpp
/// @brief Breaker thresholds, open windows and the half-open trial

#include <unity.h>
#include <cstdlib>
#include <cstring>
#include <main/session/circuit_breaker.hpp>

namespace {
    void failTimes(CircuitBreaker& breaker, uint32_t times, uint32_t now_ms) {
        for (uint32_t i = 0; i < times; ++i) {
            breaker.recordFailure(now_ms);
        }
    }

    // Elapse the current window and fail the half-open trial
    uint32_t failTrial(CircuitBreaker& breaker, uint32_t now_ms) {
        now_ms += breaker.openDurationMs();
        TEST_ASSERT_TRUE(breaker.canAttempt(now_ms));
        breaker.recordFailure(now_ms);
        return now_ms;
    }
}

void setUp() {}
void tearDown() {}

void test_opens_at_threshold() {
    CircuitBreaker breaker;
    failTimes(breaker, 2, 0);
    TEST_ASSERT_EQUAL(CircuitBreaker::State::CLOSED, breaker.state());
    TEST_ASSERT_TRUE(breaker.canAttempt(0));
    breaker.recordFailure(0);
    TEST_ASSERT_EQUAL(CircuitBreaker::State::OPEN, breaker.state());
    TEST_ASSERT_EQUAL_UINT32(60000, breaker.openDurationMs());
}

void test_success_resets_count() {
    CircuitBreaker breaker;
    failTimes(breaker, 2, 0);
    breaker.recordSuccess();
    TEST_ASSERT_EQUAL_UINT32(0, breaker.failureCount());
    failTimes(breaker, 2, 0);
    TEST_ASSERT_EQUAL(CircuitBreaker::State::CLOSED, breaker.state());
}

void test_open_blocks_until_window_elapses() {
    CircuitBreaker breaker;
    failTimes(breaker, 3, 1000);
    uint32_t remaining = 0;
    TEST_ASSERT_FALSE(breaker.canAttempt(1000 + 59999, &remaining));
    TEST_ASSERT_EQUAL_UINT32(1, remaining);
    TEST_ASSERT_TRUE(breaker.canAttempt(1000 + 60000, &remaining));
    TEST_ASSERT_EQUAL_UINT32(0, remaining);
    TEST_ASSERT_EQUAL(CircuitBreaker::State::HALF_OPEN, breaker.state());
}

void test_half_open_allows_single_trial() {
    CircuitBreaker breaker;
    failTimes(breaker, 3, 0);
    TEST_ASSERT_TRUE(breaker.canAttempt(60000));
    TEST_ASSERT_FALSE(breaker.canAttempt(60001));
    breaker.recordSuccess();
    TEST_ASSERT_EQUAL(CircuitBreaker::State::CLOSED, breaker.state());
    TEST_ASSERT_EQUAL_UINT32(0, breaker.tripCount());
    TEST_ASSERT_TRUE(breaker.canAttempt(60002));
}

void test_backoff_doubles_and_caps() {
    CircuitBreaker breaker;
    failTimes(breaker, 3, 0);
    TEST_ASSERT_EQUAL_UINT32(60000, breaker.openDurationMs());

    uint32_t now = failTrial(breaker, 0);
    TEST_ASSERT_EQUAL(CircuitBreaker::State::OPEN, breaker.state());
    TEST_ASSERT_EQUAL_UINT32(120000, breaker.openDurationMs());

    now = failTrial(breaker, now);
    TEST_ASSERT_EQUAL_UINT32(240000, breaker.openDurationMs());

    for (int i = 0; i < 10; ++i) {
        now = failTrial(breaker, now);
    }
    TEST_ASSERT_EQUAL_UINT32(3600000, breaker.openDurationMs());
}

void test_half_open_failure_reopens_immediately() {
    CircuitBreaker breaker;
    failTimes(breaker, 3, 0);
    TEST_ASSERT_TRUE(breaker.canAttempt(60000));
    breaker.recordFailure(60000);
    TEST_ASSERT_EQUAL(CircuitBreaker::State::OPEN, breaker.state());
    TEST_ASSERT_FALSE(breaker.canAttempt(60000 + 119999));
}

void test_describe() {
    CircuitBreaker breaker;
    char text[48];
    breaker.describe(0, text, sizeof(text));
    TEST_ASSERT_EQUAL_STRING("CLOSED (0 failures)", text);
    failTimes(breaker, 3, 0);
    breaker.describe(18000, text, sizeof(text));
    TEST_ASSERT_EQUAL_STRING("OPEN (3 failures, 42 s left)", text);
}

void test_custom_options() {
    BreakerOptions options;
    options.failure_threshold = 1;
    options.base_open_ms = 500;
    options.max_open_ms = 1500;
    CircuitBreaker breaker(options);
    breaker.recordFailure(0);
    TEST_ASSERT_EQUAL(CircuitBreaker::State::OPEN, breaker.state());
    uint32_t now = failTrial(breaker, 0);
    now = failTrial(breaker, now);
    TEST_ASSERT_EQUAL_UINT32(1500, breaker.openDurationMs());
}

extern "C" void app_main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_opens_at_threshold);
    RUN_TEST(test_success_resets_count);
    RUN_TEST(test_open_blocks_until_window_elapses);
    RUN_TEST(test_half_open_allows_single_trial);
    RUN_TEST(test_backoff_doubles_and_caps);
    RUN_TEST(test_half_open_failure_reopens_immediately);
    RUN_TEST(test_describe);
    RUN_TEST(test_custom_options);
    std::exit(UNITY_END());
}
