#include "contourfield/tilecache.h"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace contourfield::tilecache;

namespace {

TileKey key(int i) { return {0, i, 0}; }

// Checks that free slots and occupied slots partition [0, capacity).
template <typename T>
void expect_partition(const TileCache<T>& cache) {
    std::set<uint32_t> occupied;
    cache.for_each([&](const CachedTile<T>& t) {
        EXPECT_TRUE(occupied.insert(t.slot.value()).second) << "slot shared by two tiles";
        EXPECT_LT(t.slot.value(), cache.capacity());
    });
    EXPECT_EQ(occupied.size() + cache.stats().free_slots, cache.capacity());
}

} // namespace

TEST(TileCache, ZeroCapacityRejected) {
    EXPECT_THROW(TileCache<int>(0), std::invalid_argument);
}

TEST(TileCache, EvictEmptyIsLogicError) {
    TileCache<int> cache(4);
    EXPECT_THROW(cache.evict_lru(), std::logic_error);
}

TEST(TileCache, KeyEqualityAndHash) {
    TileKey a{1, 2, 3};
    TileKey b{1, 2, 3};
    TileKey c{1, 3, 2};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(std::hash<TileKey>{}(a), std::hash<TileKey>{}(b));
}

TEST(TileCache, GetDoesNotTouch) {
    TileCache<std::string> cache(2);
    cache.allocate(key(0), "a");
    cache.advance_frame();
    auto* t = cache.get(key(0));
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->last_access_frame, 0u);
    EXPECT_EQ(t->data, "a");
    EXPECT_EQ(cache.get(key(1)), nullptr);
}

TEST(TileCache, AllocateExistingUpdatesDataAndRecency) {
    TileCache<int> cache(2);
    const SlotIndex slot = cache.allocate(key(0), 1).slot;
    cache.advance_frame();
    cache.advance_frame();
    auto& again = cache.allocate(key(0), 2);
    EXPECT_EQ(again.slot, slot);
    EXPECT_EQ(again.data, 2);
    EXPECT_EQ(again.last_access_frame, 2u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(TileCache, OverflowEvictsOldestInAllocationOrder) {
    constexpr int capacity = 5;
    constexpr int extra = 3;
    TileCache<int> cache(capacity);

    for (int i = 0; i < capacity + extra; i++) {
        cache.allocate(key(i), i);
        EXPECT_LE(cache.size(), static_cast<size_t>(capacity));
        expect_partition(cache);
    }

    EXPECT_EQ(cache.stats().evictions, static_cast<uint64_t>(extra));
    for (int i = 0; i < extra; i++) EXPECT_EQ(cache.get(key(i)), nullptr) << i;
    for (int i = extra; i < capacity + extra; i++) EXPECT_NE(cache.get(key(i)), nullptr) << i;
}

TEST(TileCache, TouchProtectsFromEviction) {
    TileCache<int> cache(3);
    for (int i = 0; i < 3; i++) {
        cache.allocate(key(i), i);
        cache.advance_frame();
    }
    cache.touch(*cache.get(key(0)));
    cache.allocate(key(3), 3);

    EXPECT_NE(cache.get(key(0)), nullptr);
    EXPECT_EQ(cache.get(key(1)), nullptr);
}

TEST(TileCache, EvictionReusesSlot) {
    TileCache<int> cache(2);
    const SlotIndex first = cache.allocate(key(0), 0).slot;
    cache.advance_frame();
    cache.allocate(key(1), 1);
    cache.advance_frame();
    const SlotIndex reused = cache.allocate(key(2), 2).slot;
    EXPECT_EQ(reused, first);
}

TEST(TileCache, NoEvictionWhileFreeSlotsRemain) {
    TileCache<int> cache(4);
    for (int i = 0; i < 4; i++) cache.allocate(key(i), i);
    EXPECT_EQ(cache.stats().evictions, 0u);
    EXPECT_EQ(cache.stats().free_slots, 0u);
}

TEST(TileCache, ExplicitEvictReturnsSlotToPool) {
    TileCache<int> cache(2);
    cache.allocate(key(0), 0);
    cache.advance_frame();
    cache.allocate(key(1), 1);
    const SlotIndex freed = cache.evict_lru();
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.stats().free_slots, 1u);
    EXPECT_EQ(cache.get(key(0)), nullptr);
    expect_partition(cache);
    EXPECT_EQ(cache.allocate(key(2), 2).slot, freed);
}

TEST(TileCache, ClearRefillsPool) {
    TileCache<int> cache(3);
    for (int i = 0; i < 5; i++) cache.allocate(key(i), i);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.stats().free_slots, 3u);
    EXPECT_EQ(cache.allocate(key(9), 9).slot, SlotIndex(0));
    expect_partition(cache);
}

TEST(TileCache, AdvanceFrame) {
    TileCache<int> cache(1);
    EXPECT_EQ(cache.current_frame(), 0u);
    cache.advance_frame();
    cache.advance_frame();
    EXPECT_EQ(cache.current_frame(), 2u);
    EXPECT_EQ(cache.allocate(key(0), 0).last_access_frame, 2u);
}
