#include "contourfield/vtex.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <climits>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace contourfield::vtex;

namespace {

struct Dispatch {
    TileKey key;
    TileFootprint footprint;
    SlotIndex slot;
};

class RecordingBackend : public TileComputeBackend {
public:
    void compute(const TileKey& key, const TileFootprint& footprint, SlotIndex slot) override {
        calls.push_back({key, footprint, slot});
        if (fail_next) {
            fail_next = false;
            throw std::runtime_error("device lost");
        }
    }

    std::vector<Dispatch> calls;
    bool fail_next = false;
};

VirtualTextureConfig small_config(int budget = 4, size_t max_tiles = 16) {
    VirtualTextureConfig cfg;
    cfg.tile_size = 64;
    cfg.max_tiles = max_tiles;
    cfg.max_tiles_per_frame = budget;
    cfg.max_lod = 4;
    cfg.label = "test";
    return cfg;
}

} // namespace

TEST(VirtualTexture, RejectsBadConfig) {
    RecordingBackend backend;
    auto cfg = small_config();
    cfg.max_tiles = 0;
    EXPECT_THROW((VirtualTexture(cfg, backend)), std::invalid_argument);

    cfg = small_config(0);
    EXPECT_THROW((VirtualTexture(cfg, backend)), std::invalid_argument);

    cfg = small_config();
    cfg.tile_size = 0;
    EXPECT_THROW((VirtualTexture(cfg, backend)), std::invalid_argument);
}

TEST(VirtualTexture, RectCoversTileRange) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(), backend);

    // Tiles are 64 units at lod 0: x in [-1, 1], y in [0, 1].
    vt.request_tiles_for_rect({-10, 5, 70, 100}, 0);
    ASSERT_EQ(vt.pending().size(), 6u);
    EXPECT_EQ(vt.pending().front(), (TileKey{0, -1, 0}));
    EXPECT_EQ(vt.pending().back(), (TileKey{0, 1, 1}));

    // Same rect at lod 1 is one 128-unit tile row: x in [-1, 0], y 0.
    vt.request_tiles_for_rect({-10, 5, 70, 100}, 1);
    EXPECT_EQ(vt.pending().size(), 8u);
}

TEST(VirtualTexture, RequestsAreDeduplicated) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(), backend);
    vt.request_tile(0, 1, 1);
    vt.request_tile(0, 1, 1);
    vt.request_tiles_for_rect({64, 64, 100, 100}, 0);
    EXPECT_EQ(vt.pending().size(), 1u);

    vt.update(0.016);
    EXPECT_TRUE(vt.is_cached({0, 1, 1}));
    vt.request_tile(0, 1, 1);
    EXPECT_TRUE(vt.pending().empty());
}

TEST(VirtualTexture, BudgetPreservesFifoOrder) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(3), backend);
    for (int i = 0; i < 8; i++) vt.request_tile(0, i, 0);

    int calls = 0;
    while (!vt.pending().empty()) {
        const size_t before = backend.calls.size();
        vt.update(0.016);
        calls++;
        const size_t processed = backend.calls.size() - before;
        EXPECT_EQ(processed, std::min<size_t>(3, 8 - before));
        EXPECT_EQ(vt.stats().computed_this_frame, static_cast<int>(processed));
    }
    EXPECT_EQ(calls, 3);  // ceil(8 / 3)

    ASSERT_EQ(backend.calls.size(), 8u);
    for (int i = 0; i < 8; i++) EXPECT_EQ(backend.calls[static_cast<size_t>(i)].key.tile_x, i);
}

TEST(VirtualTexture, FrameAdvancesOncePerUpdate) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(2), backend);
    for (int i = 0; i < 5; i++) vt.request_tile(0, i, 0);
    vt.update(0.016);
    EXPECT_EQ(vt.stats().frame, 1u);
    vt.update(0.016);
    vt.update(0.016);
    vt.update(0.016);
    EXPECT_EQ(vt.stats().frame, 4u);
    EXPECT_EQ(vt.stats().computed_this_frame, 0);
}

TEST(VirtualTexture, BackendReceivesFootprintAndSlot) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(), backend);
    vt.request_tile(2, -1, 3);
    vt.update(0.016);

    ASSERT_EQ(backend.calls.size(), 1u);
    const auto& d = backend.calls[0];
    EXPECT_DOUBLE_EQ(d.footprint.world_size, 256.0);
    EXPECT_DOUBLE_EQ(d.footprint.origin_x, -256.0);
    EXPECT_DOUBLE_EQ(d.footprint.origin_y, 768.0);
    EXPECT_EQ(d.footprint.tile_size, 64);
    EXPECT_DOUBLE_EQ(d.footprint.texel_size(), 4.0);

    const Tile* tile = vt.get_tile(2, -1, 3);
    ASSERT_NE(tile, nullptr);
    EXPECT_EQ(tile->slot, d.slot);
}

TEST(VirtualTexture, CoarserTileServesFinerRequest) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(), backend);
    vt.request_tile(2, 1, 0);
    vt.update(0.016);

    // Lod 0 tile (5, 2) halves to (2, 1) then (1, 0) at lod 2.
    const Tile* tile = vt.get_tile(0, 5, 2);
    ASSERT_NE(tile, nullptr);
    EXPECT_EQ(tile->key, (TileKey{2, 1, 0}));

    // Exact hit wins once the finer tile is resident.
    vt.request_tile(0, 5, 2);
    vt.update(0.016);
    EXPECT_EQ(vt.get_tile(0, 5, 2)->key, (TileKey{0, 5, 2}));
}

TEST(VirtualTexture, FallbackHandlesNegativeCoordinates) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(), backend);
    vt.request_tile(1, -1, -1);
    vt.update(0.016);
    // (-1, -2) and (-2, -1) at lod 0 both live under (-1, -1) at lod 1.
    ASSERT_NE(vt.get_tile(0, -1, -2), nullptr);
    EXPECT_EQ(vt.get_tile(0, -2, -1)->key, (TileKey{1, -1, -1}));
    EXPECT_EQ(vt.get_tile(0, 0, -1), nullptr);
}

TEST(VirtualTexture, MissingEverywhereIsNull) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(), backend);
    EXPECT_EQ(vt.get_tile(0, 0, 0), nullptr);
    EXPECT_EQ(vt.get_tile(4, 0, 0), nullptr);
    EXPECT_EQ(vt.get_tile(-1, 0, 0), nullptr);
    EXPECT_EQ(vt.get_tile(9, 0, 0), nullptr);
}

TEST(VirtualTexture, GetTileRefreshesRecency) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(8, 2), backend);
    vt.request_tile(0, 0, 0);
    vt.update(0.016);
    vt.request_tile(0, 1, 0);
    vt.update(0.016);

    ASSERT_NE(vt.get_tile(0, 0, 0), nullptr);
    vt.request_tile(0, 2, 0);
    vt.update(0.016);

    EXPECT_TRUE(vt.is_cached({0, 0, 0}));
    EXPECT_FALSE(vt.is_cached({0, 1, 0}));
    EXPECT_EQ(vt.stats().evictions, 1u);
}

TEST(VirtualTexture, InvalidateClearsCacheAndQueue) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(1), backend);
    for (int i = 0; i < 3; i++) vt.request_tile(0, i, 0);
    vt.update(0.016);
    vt.invalidate();
    auto s = vt.stats();
    EXPECT_EQ(s.cached, 0u);
    EXPECT_EQ(s.pending, 0u);
    EXPECT_EQ(vt.get_tile(0, 0, 0), nullptr);
}

TEST(VirtualTexture, BackendFailureIsCountedNotRetried) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(), backend);
    backend.fail_next = true;
    vt.request_tile(0, 0, 0);
    vt.request_tile(0, 1, 0);
    vt.update(0.016);

    EXPECT_EQ(backend.calls.size(), 2u);
    EXPECT_EQ(vt.stats().dispatch_failures, 1u);
    EXPECT_TRUE(vt.pending().empty());
    EXPECT_TRUE(vt.is_cached({0, 0, 0}));
}

TEST(VirtualTexture, LodOutOfRangeRejected) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(), backend);
    EXPECT_THROW(vt.request_tile(-1, 0, 0), std::invalid_argument);
    EXPECT_THROW(vt.request_tiles_for_rect({0, 0, 1, 1}, 5), std::invalid_argument);
}

TEST(VirtualTexture, TileRangeUsesFloorDivision) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(), backend);
    const TileRange r = vt.tile_range({-64, -1, 63.9, 128}, 0);
    EXPECT_EQ(r.min_x, -1);
    EXPECT_EQ(r.min_y, -1);
    EXPECT_EQ(r.max_x, 0);
    EXPECT_EQ(r.max_y, 2);
}

TEST(VirtualTexture, RejectsRectOutsideTileGrid) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(), backend);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_THROW(vt.request_tiles_for_rect({0, 0, 1e300, 1}, 0), std::invalid_argument);
    EXPECT_THROW(vt.request_tiles_for_rect({nan, 0, 1, 1}, 0), std::invalid_argument);
    EXPECT_THROW(vt.request_tiles_for_rect({-inf, 0, 1, 1}, 0), std::invalid_argument);
    EXPECT_THROW((void)vt.tile_range({0, 0, 1, 1e12}, 0), std::invalid_argument);
    EXPECT_TRUE(vt.pending().empty());
}

TEST(VirtualTexture, FallbackAtExtremeCoordinates) {
    RecordingBackend backend;
    VirtualTexture vt(small_config(), backend);
    // INT_MIN halves to INT_MIN / 2 at each coarser level.
    vt.request_tile(1, INT_MIN / 2, INT_MAX / 2);
    vt.update(0.016);

    const Tile* tile = vt.get_tile(0, INT_MIN, INT_MAX);
    ASSERT_NE(tile, nullptr);
    EXPECT_EQ(tile->key, (TileKey{1, INT_MIN / 2, INT_MAX / 2}));
    EXPECT_EQ(vt.get_tile(0, INT_MAX, INT_MIN), nullptr);
}
