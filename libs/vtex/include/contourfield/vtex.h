#pragma once

#include <contourfield/geometry.h>
#include <contourfield/tilecache.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace contourfield::vtex {

using tilecache::SlotIndex;
using tilecache::TileKey;

// TileFootprint is the world rectangle a tile covers and its raster size.
struct TileFootprint {
    double origin_x = 0;
    double origin_y = 0;
    double world_size = 0;
    int tile_size = 0;

    [[nodiscard]] double texel_size() const { return world_size / tile_size; }
};

struct TileMetadata {
    uint64_t computed_frame = 0;
    uint64_t dispatch_id = 0;
};

using Tile = tilecache::CachedTile<TileMetadata>;

// TileRange is an inclusive range of tile coordinates at one level.
struct TileRange {
    int min_x = 0;
    int min_y = 0;
    int max_x = -1;
    int max_y = -1;
};

// TileComputeBackend fills a slot with tile_size x tile_size samples of the
// field over the footprint. Work may complete after compute() returns, but
// must execute in submission order.
class TileComputeBackend {
public:
    virtual ~TileComputeBackend() = default;
    virtual void compute(const TileKey& key, const TileFootprint& footprint, SlotIndex slot) = 0;
};

struct VirtualTextureConfig {
    int tile_size = 128;
    size_t max_tiles = 512;
    int max_tiles_per_frame = 8;
    int max_lod = 8;
    std::string label = "VirtualTexture";
};

struct VirtualTextureStats {
    size_t cached = 0;
    size_t pending = 0;
    int computed_this_frame = 0;
    uint64_t computed_total = 0;
    uint64_t dispatch_failures = 0;
    uint64_t evictions = 0;
    uint64_t frame = 0;
};

// VirtualTexture streams tiles of one field through a TileCache. Requests
// queue up FIFO, at most max_tiles_per_frame are dispatched per update(),
// and reads fall back to coarser resident tiles while the exact one streams in.
// Level 0 is the finest; each level doubles the world size of a tile.
class VirtualTexture {
public:
    VirtualTexture(VirtualTextureConfig config, TileComputeBackend& backend);

    // TileRange returns the tiles overlapping rect at lod. Throws
    // std::invalid_argument when a bound is not finite or its tile index does
    // not fit in an int.
    [[nodiscard]] TileRange tile_range(const geometry::BBox& rect, int lod) const;

    // RequestTilesForRect queues every tile overlapping rect at lod.
    void request_tiles_for_rect(const geometry::BBox& rect, int lod);

    // RequestTile queues a tile unless it is cached or already pending.
    void request_tile(int lod, int tile_x, int tile_y);

    // Update dispatches up to the per-frame budget from the head of the queue
    // and then advances the cache frame exactly once.
    void update(double dt);

    // GetTile returns the exact tile, else the nearest resident coarser tile
    // covering it, else nullptr. Hits are touched.
    const Tile* get_tile(int lod, int tile_x, int tile_y);

    // Invalidate drops every cached tile and pending request. Backend work
    // already dispatched is not cancelled.
    void invalidate();

    [[nodiscard]] TileFootprint footprint(const TileKey& key) const;
    [[nodiscard]] double world_tile_size(int lod) const;
    [[nodiscard]] bool is_pending(const TileKey& key) const;
    [[nodiscard]] bool is_cached(const TileKey& key) const { return cache_.contains(key); }
    [[nodiscard]] const std::deque<TileKey>& pending() const { return pending_; }
    [[nodiscard]] const VirtualTextureConfig& config() const { return config_; }
    [[nodiscard]] VirtualTextureStats stats() const;

private:
    void compute_tile(const TileKey& key);
    void check_lod(int lod) const;

    VirtualTextureConfig config_;
    TileComputeBackend& backend_;
    tilecache::TileCache<TileMetadata> cache_;
    std::deque<TileKey> pending_;
    int computed_this_frame_ = 0;
    uint64_t computed_total_ = 0;
    uint64_t dispatch_failures_ = 0;
};

} // namespace contourfield::vtex
