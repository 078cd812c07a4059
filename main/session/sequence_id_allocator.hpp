#ifndef SEQUENCE_ID_ALLOCATOR_HPP
#define SEQUENCE_ID_ALLOCATOR_HPP

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <esp_random.h>

// Issues the sequence byte that correlates a request with its notification.
// Not thread-safe; owned by one SensorSession and used under its lock.
class SequenceIdAllocator {
public:
    using RandomSource = uint32_t (*)();

    static constexpr size_t ID_SPACE = 256;
    // Reaching this many in-use ids means releases were lost; the set is cleared
    static constexpr size_t HIGH_WATER_MARK = 250;
    static constexpr int RANDOM_ATTEMPTS = 100;

    explicit SequenceIdAllocator(RandomSource random_source = esp_random);

    uint8_t allocate();
    void release(uint8_t id);

    bool isInUse(uint8_t id) const;
    size_t inUseCount() const;
    uint32_t forcedClears() const { return forced_clears; }

private:
    std::bitset<ID_SPACE> in_use;
    RandomSource random_source;
    uint32_t forced_clears;
};

#endif // SEQUENCE_ID_ALLOCATOR_HPP
