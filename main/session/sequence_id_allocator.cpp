#include <main/session/sequence_id_allocator.hpp>
#include <main/utils/logger.hpp>

namespace {
    static const char* TAG = "SEQ_ID";
}

SequenceIdAllocator::SequenceIdAllocator(RandomSource random_source)
    : random_source(random_source), forced_clears(0) {}

uint8_t SequenceIdAllocator::allocate() {
    if (in_use.count() >= HIGH_WATER_MARK) {
        LOG_WARN(TAG, "%u sequence ids in use, clearing the set", static_cast<unsigned>(in_use.count()));
        in_use.reset();
        ++forced_clears;
    }

    for (int attempt = 0; attempt < RANDOM_ATTEMPTS; ++attempt) {
        const uint8_t candidate = static_cast<uint8_t>(random_source() & 0xFF);
        if (!in_use.test(candidate)) {
            in_use.set(candidate);
            return candidate;
        }
    }

    // Random probing kept colliding; take the first free id
    for (size_t id = 0; id < ID_SPACE; ++id) {
        if (!in_use.test(id)) {
            in_use.set(id);
            return static_cast<uint8_t>(id);
        }
    }

    // Unreachable while HIGH_WATER_MARK < ID_SPACE
    in_use.reset();
    ++forced_clears;
    in_use.set(0);
    return 0;
}

void SequenceIdAllocator::release(uint8_t id) {
    in_use.reset(id);
}

bool SequenceIdAllocator::isInUse(uint8_t id) const {
    return in_use.test(id);
}

size_t SequenceIdAllocator::inUseCount() const {
    return in_use.count();
}
