#ifndef CIRCULAR_BUFFER_HPP
#define CIRCULAR_BUFFER_HPP

#include <array>
#include <cstddef>
#include <cstdint>

// Fixed-capacity ring that keeps the newest Capacity items.
// - No dynamic allocation (storage is embedded).
// - No internal locking; owned by a single task.
// - When full, push() evicts the oldest item and counts it in evicted().
template<typename T, std::size_t Capacity>
class CircularBuffer {
public:
    static_assert(Capacity > 0, "CircularBuffer capacity must be greater than zero");

    CircularBuffer() : head_index(0), tail_index(0), count(0), evicted_count(0) {}

    // Returns false when an older item had to be evicted
    bool push(const T& value) {
        bool kept_all = true;
        if (count == Capacity) {
            tail_index = (tail_index + 1U) % Capacity;
            --count;
            ++evicted_count;
            kept_all = false;
        }
        storage[head_index] = value;
        head_index = (head_index + 1U) % Capacity;
        ++count;
        return kept_all;
    }

    // Oldest item without removing it
    bool peek(T& out_value) const {
        if (count == 0U) {
            return false;
        }
        out_value = storage[tail_index];
        return true;
    }

    bool pop(T& out_value) {
        if (count == 0U) {
            return false;
        }
        out_value = storage[tail_index];
        tail_index = (tail_index + 1U) % Capacity;
        --count;
        return true;
    }

    bool isEmpty() const { return count == 0U; }
    std::size_t size() const { return count; }
    uint32_t evicted() const { return evicted_count; }

private:
    std::array<T, Capacity> storage;
    std::size_t head_index;
    std::size_t tail_index;
    std::size_t count;
    uint32_t evicted_count;
};

#endif // CIRCULAR_BUFFER_HPP
