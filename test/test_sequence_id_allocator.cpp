/// @file test_sequence_id_allocator.cpp
/// @brief Sequence id allocation, release and the high-water clear

#include <unity.h>
#include <cstdlib>
#include <main/session/sequence_id_allocator.hpp>

namespace {
    uint32_t g_next = 0;
    uint32_t g_fixed = 0;

    uint32_t countingSource() { return g_next++; }
    uint32_t fixedSource() { return g_fixed; }
}

void setUp() {
    g_next = 0;
    g_fixed = 0;
}
void tearDown() {}

void test_allocate_marks_in_use() {
    SequenceIdAllocator ids(countingSource);
    const uint8_t a = ids.allocate();
    const uint8_t b = ids.allocate();
    TEST_ASSERT_NOT_EQUAL(a, b);
    TEST_ASSERT_TRUE(ids.isInUse(a));
    TEST_ASSERT_TRUE(ids.isInUse(b));
    TEST_ASSERT_EQUAL_UINT(2, ids.inUseCount());
}

void test_release_frees_id() {
    SequenceIdAllocator ids(countingSource);
    const uint8_t a = ids.allocate();
    ids.release(a);
    TEST_ASSERT_FALSE(ids.isInUse(a));
    TEST_ASSERT_EQUAL_UINT(0, ids.inUseCount());
    // Releasing twice is harmless
    ids.release(a);
    TEST_ASSERT_EQUAL_UINT(0, ids.inUseCount());
}

void test_collisions_fall_back_to_scan() {
    // Random source stuck on one value: the second id must still be distinct
    g_fixed = 0x42;
    SequenceIdAllocator ids(fixedSource);
    TEST_ASSERT_EQUAL_HEX8(0x42, ids.allocate());
    const uint8_t second = ids.allocate();
    TEST_ASSERT_NOT_EQUAL(0x42, second);
    TEST_ASSERT_EQUAL_HEX8(0x00, second);
}

void test_never_returns_in_use_id() {
    SequenceIdAllocator ids(countingSource);
    for (size_t i = 0; i < SequenceIdAllocator::HIGH_WATER_MARK; ++i) {
        const uint8_t id = ids.allocate();
        (void)id;
    }
    TEST_ASSERT_EQUAL_UINT(SequenceIdAllocator::HIGH_WATER_MARK, ids.inUseCount());
    TEST_ASSERT_EQUAL_UINT32(0, ids.forcedClears());
}

void test_high_water_mark_clears_set() {
    SequenceIdAllocator ids(countingSource);
    for (size_t i = 0; i < SequenceIdAllocator::HIGH_WATER_MARK; ++i) {
        (void)ids.allocate();
    }
    (void)ids.allocate();
    TEST_ASSERT_EQUAL_UINT32(1, ids.forcedClears());
    TEST_ASSERT_EQUAL_UINT(1, ids.inUseCount());
}

extern "C" void app_main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_allocate_marks_in_use);
    RUN_TEST(test_release_frees_id);
    RUN_TEST(test_collisions_fall_back_to_scan);
    RUN_TEST(test_never_returns_in_use_id);
    RUN_TEST(test_high_water_mark_clears_set);
    std::exit(UNITY_END());
}
