#ifndef CIRCUIT_BREAKER_HPP
#define CIRCUIT_BREAKER_HPP

#include <cstddef>
#include <cstdint>
#include <main/config/config.hpp>

struct BreakerOptions {
    uint32_t failure_threshold = Config::Breaker::failure_threshold;
    uint32_t base_open_ms = Config::Breaker::base_open_ms;
    uint32_t max_open_ms = Config::Breaker::max_open_ms;
};

// Gates protocol operations after repeated failures.
//
// CLOSED    operations pass; failure_threshold consecutive failures trip it.
// OPEN      operations are refused until the open window elapses. The window is
//           base_open_ms * 2^(trips - 1), capped at max_open_ms, where trips
//           counts OPEN entries since the last success.
// HALF_OPEN a single trial passes. Success closes the breaker, failure reopens
//           it at once with the next, doubled window.
//
// Time is passed in by the caller. Not thread-safe; SensorSession serializes access.
class CircuitBreaker {
public:
    enum class State : uint8_t {
        CLOSED = 0,
        OPEN = 1,
        HALF_OPEN = 2
    };

    explicit CircuitBreaker(const BreakerOptions& options = BreakerOptions());

    // Also performs the OPEN -> HALF_OPEN transition. remaining_ms, when given,
    // receives the time left in the open window (0 when allowed).
    bool canAttempt(uint32_t now_ms, uint32_t* remaining_ms = nullptr);

    void recordSuccess();
    void recordFailure(uint32_t now_ms);

    State state() const { return current; }
    uint32_t failureCount() const { return failures; }
    uint32_t tripCount() const { return trips; }
    // Length of the current (or most recent) open window
    uint32_t openDurationMs() const;

    // e.g. "OPEN (3 failures, 42 s left)"
    void describe(uint32_t now_ms, char* out, size_t out_size) const;

    static const char* stateName(State state);

private:
    void trip(uint32_t now_ms);

    BreakerOptions options;
    State current;
    uint32_t failures;
    uint32_t trips;
    uint32_t opened_at_ms;
    bool trial_in_flight;
};

#endif // CIRCUIT_BREAKER_HPP
