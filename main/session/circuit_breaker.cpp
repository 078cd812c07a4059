#include <main/session/circuit_breaker.hpp>
#include <main/utils/logger.hpp>
#include <cstdio>

namespace {
    static const char* TAG = "CIRCUIT";
    // 2^20 * base already exceeds any sane cap
    static constexpr uint32_t MAX_BACKOFF_SHIFT = 20;
}

CircuitBreaker::CircuitBreaker(const BreakerOptions& options)
    : options(options),
      current(State::CLOSED),
      failures(0),
      trips(0),
      opened_at_ms(0),
      trial_in_flight(false) {}

uint32_t CircuitBreaker::openDurationMs() const {
    if (trips == 0) {
        return 0;
    }
    uint32_t shift = trips - 1;
    if (shift > MAX_BACKOFF_SHIFT) {
        shift = MAX_BACKOFF_SHIFT;
    }
    const uint64_t duration = static_cast<uint64_t>(options.base_open_ms) << shift;
    return duration > options.max_open_ms ? options.max_open_ms : static_cast<uint32_t>(duration);
}

bool CircuitBreaker::canAttempt(uint32_t now_ms, uint32_t* remaining_ms) {
    if (remaining_ms != nullptr) {
        *remaining_ms = 0;
    }
    switch (current) {
        case State::CLOSED:
            return true;

        case State::OPEN: {
            const uint32_t elapsed = now_ms - opened_at_ms;
            const uint32_t window = openDurationMs();
            if (elapsed < window) {
                if (remaining_ms != nullptr) {
                    *remaining_ms = window - elapsed;
                }
                return false;
            }
            current = State::HALF_OPEN;
            failures = 0;
            trial_in_flight = true;
            LOG_INFO(TAG, "Open window of %lu s elapsed, HALF_OPEN trial",
                     static_cast<unsigned long>(window / 1000));
            return true;
        }

        case State::HALF_OPEN:
            if (trial_in_flight) {
                return false;
            }
            trial_in_flight = true;
            return true;

        default:
            return false;
    }
}

void CircuitBreaker::recordSuccess() {
    if (current != State::CLOSED) {
        LOG_INFO(TAG, "%s -> CLOSED after success", stateName(current));
    }
    current = State::CLOSED;
    failures = 0;
    trips = 0;
    trial_in_flight = false;
}

void CircuitBreaker::recordFailure(uint32_t now_ms) {
    ++failures;
    trial_in_flight = false;

    if (current == State::HALF_OPEN) {
        trip(now_ms);
        return;
    }
    if (current == State::CLOSED && failures >= options.failure_threshold) {
        trip(now_ms);
        return;
    }
    LOG_DEBUG(TAG, "Failure %lu/%lu recorded", static_cast<unsigned long>(failures),
              static_cast<unsigned long>(options.failure_threshold));
}

void CircuitBreaker::trip(uint32_t now_ms) {
    ++trips;
    current = State::OPEN;
    opened_at_ms = now_ms;
    LOG_WARN(TAG, "OPEN for %lu s after %lu consecutive failures (trip %lu)",
             static_cast<unsigned long>(openDurationMs() / 1000),
             static_cast<unsigned long>(failures),
             static_cast<unsigned long>(trips));
}

void CircuitBreaker::describe(uint32_t now_ms, char* out, size_t out_size) const {
    if (out == nullptr || out_size == 0) {
        return;
    }
    switch (current) {
        case State::OPEN: {
            const uint32_t elapsed = now_ms - opened_at_ms;
            const uint32_t window = openDurationMs();
            const uint32_t left = elapsed < window ? window - elapsed : 0;
            std::snprintf(out, out_size, "OPEN (%lu failures, %lu s left)",
                          static_cast<unsigned long>(failures),
                          static_cast<unsigned long>((left + 999) / 1000));
            break;
        }
        case State::HALF_OPEN:
            std::snprintf(out, out_size, "HALF_OPEN (trial %s)", trial_in_flight ? "running" : "pending");
            break;
        case State::CLOSED:
        default:
            std::snprintf(out, out_size, "CLOSED (%lu failures)", static_cast<unsigned long>(failures));
            break;
    }
}

const char* CircuitBreaker::stateName(State state) {
    switch (state) {
        case State::CLOSED:    return "CLOSED";
        case State::OPEN:      return "OPEN";
        case State::HALF_OPEN: return "HALF_OPEN";
        default:               return "UNKNOWN";
    }
}
