#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace contourfield::tilecache {

// TileKey identifies a tile by level of detail and grid coordinate.
struct TileKey {
    int lod = 0;
    int tile_x = 0;
    int tile_y = 0;

    bool operator==(const TileKey&) const = default;
};

// SlotIndex is a stable handle into the backing tile array. It is never
// created implicitly from an integer.
class SlotIndex {
public:
    constexpr SlotIndex() = default;
    constexpr explicit SlotIndex(uint32_t value) : value_(value) {}

    [[nodiscard]] constexpr uint32_t value() const { return value_; }

    auto operator<=>(const SlotIndex&) const = default;

private:
    uint32_t value_ = 0;
};

template <typename T>
struct CachedTile {
    TileKey key;
    SlotIndex slot;
    uint64_t last_access_frame = 0;
    uint64_t access_order = 0;  // breaks ties between accesses in one frame
    T data{};
};

struct CacheStats {
    size_t size = 0;
    size_t capacity = 0;
    size_t free_slots = 0;
    uint64_t evictions = 0;
};

} // namespace contourfield::tilecache

namespace std {
template <>
struct hash<contourfield::tilecache::TileKey> {
    size_t operator()(const contourfield::tilecache::TileKey& k) const noexcept {
        size_t h = hash<int>{}(k.lod);
        h ^= hash<int>{}(k.tile_x) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        h ^= hash<int>{}(k.tile_y) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        return h;
    }
};
} // namespace std

namespace contourfield::tilecache {

// TileCache maps tile keys onto a fixed pool of slots. When the pool is
// exhausted the least recently touched tile gives up its slot. Slot contents
// are never moved; only the key and data assigned to a slot change.
template <typename T>
class TileCache {
public:
    explicit TileCache(size_t capacity) : capacity_(capacity) {
        if (capacity == 0) throw std::invalid_argument("TileCache: capacity must be greater than zero");
        if (capacity > UINT32_MAX) throw std::invalid_argument("TileCache: capacity exceeds slot range");
        refill_free_slots();
    }

    // Get looks up key without refreshing its recency.
    [[nodiscard]] CachedTile<T>* get(const TileKey& key) {
        auto it = tiles_.find(key);
        return it == tiles_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] const CachedTile<T>* get(const TileKey& key) const {
        auto it = tiles_.find(key);
        return it == tiles_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(const TileKey& key) const { return tiles_.count(key) != 0; }

    // Allocate returns the record for key, assigning a slot if it has none.
    // A free slot is used before anything is evicted.
    CachedTile<T>& allocate(const TileKey& key, T data) {
        if (auto* existing = get(key)) {
            existing->data = std::move(data);
            touch(*existing);
            return *existing;
        }

        SlotIndex slot;
        if (!free_.empty()) {
            slot = free_.back();
            free_.pop_back();
        } else {
            slot = take_lru_slot();
        }

        CachedTile<T> tile;
        tile.key = key;
        tile.slot = slot;
        tile.last_access_frame = current_frame_;
        tile.access_order = ++access_counter_;
        tile.data = std::move(data);
        return tiles_.emplace(key, std::move(tile)).first->second;
    }

    void touch(CachedTile<T>& tile) {
        tile.last_access_frame = current_frame_;
        tile.access_order = ++access_counter_;
    }

    // AdvanceFrame is called exactly once per outer tick.
    void advance_frame() { ++current_frame_; }

    void clear() {
        tiles_.clear();
        refill_free_slots();
    }

    // EvictLRU removes the tile with the oldest access and returns its slot to
    // the free pool. Evicting from an empty cache is a logic error.
    SlotIndex evict_lru() {
        const SlotIndex slot = take_lru_slot();
        free_.push_back(slot);
        return slot;
    }

    [[nodiscard]] size_t size() const { return tiles_.size(); }
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] uint64_t current_frame() const { return current_frame_; }

    [[nodiscard]] CacheStats stats() const {
        return {tiles_.size(), capacity_, free_.size(), evictions_};
    }

    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& [key, tile] : tiles_) fn(tile);
    }

private:
    SlotIndex take_lru_slot() {
        if (tiles_.empty()) throw std::logic_error("TileCache: cannot evict from empty cache");

        auto oldest = tiles_.begin();
        for (auto it = tiles_.begin(); it != tiles_.end(); ++it) {
            const auto& t = it->second;
            const auto& o = oldest->second;
            if (t.last_access_frame < o.last_access_frame ||
                (t.last_access_frame == o.last_access_frame && t.access_order < o.access_order)) {
                oldest = it;
            }
        }

        const SlotIndex slot = oldest->second.slot;
        tiles_.erase(oldest);
        ++evictions_;
        return slot;
    }

    void refill_free_slots() {
        free_.clear();
        free_.reserve(capacity_);
        // Popped from the back, so slot 0 is handed out first.
        for (size_t i = capacity_; i > 0; i--) free_.emplace_back(static_cast<uint32_t>(i - 1));
    }

    size_t capacity_;
    std::unordered_map<TileKey, CachedTile<T>> tiles_;
    std::vector<SlotIndex> free_;
    uint64_t current_frame_ = 0;
    uint64_t access_counter_ = 0;
    uint64_t evictions_ = 0;
};

} // namespace contourfield::tilecache
