#include <contourfield/vtex.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <stdexcept>
#include <utility>

namespace contourfield::vtex {

static VirtualTextureConfig checked(VirtualTextureConfig config) {
    if (config.tile_size <= 0)
        throw std::invalid_argument(std::format("{}: tile_size must be positive", config.label));
    if (config.max_tiles_per_frame <= 0)
        throw std::invalid_argument(std::format("{}: max_tiles_per_frame must be positive", config.label));
    if (config.max_lod < 0 || config.max_lod > 30)
        throw std::invalid_argument(std::format("{}: max_lod must be in [0, 30]", config.label));
    return config;
}

// Parent cell index at the next coarser level. Right shift of a negative
// int is arithmetic, so this rounds toward -inf for every value.
static int floor_half(int v) {
    return v >> 1;
}

static int tile_index(double coord, double size, const std::string& label) {
    const double q = std::floor(coord / size);
    if (!std::isfinite(q) || q < static_cast<double>(std::numeric_limits<int>::min()) ||
        q > static_cast<double>(std::numeric_limits<int>::max()))
        throw std::invalid_argument(std::format("{}: rect bound {} outside the tile grid", label, coord));
    return static_cast<int>(q);
}

VirtualTexture::VirtualTexture(VirtualTextureConfig config, TileComputeBackend& backend)
    : config_(checked(std::move(config))), backend_(backend), cache_(config_.max_tiles) {}

void VirtualTexture::check_lod(int lod) const {
    if (lod < 0 || lod > config_.max_lod)
        throw std::invalid_argument(std::format("{}: lod {} outside [0, {}]", config_.label, lod, config_.max_lod));
}

double VirtualTexture::world_tile_size(int lod) const {
    return static_cast<double>(config_.tile_size) * std::ldexp(1.0, lod);
}

TileFootprint VirtualTexture::footprint(const TileKey& key) const {
    const double size = world_tile_size(key.lod);
    return {key.tile_x * size, key.tile_y * size, size, config_.tile_size};
}

TileRange VirtualTexture::tile_range(const geometry::BBox& rect, int lod) const {
    check_lod(lod);
    const double size = world_tile_size(lod);
    return {tile_index(rect.min_x, size, config_.label), tile_index(rect.min_y, size, config_.label),
            tile_index(rect.max_x, size, config_.label), tile_index(rect.max_y, size, config_.label)};
}

void VirtualTexture::request_tiles_for_rect(const geometry::BBox& rect, int lod) {
    const TileRange range = tile_range(rect, lod);
    // Counted in 64 bits so a range ending at INT_MAX terminates.
    for (int64_t y = range.min_y; y <= range.max_y; y++) {
        for (int64_t x = range.min_x; x <= range.max_x; x++)
            request_tile(lod, static_cast<int>(x), static_cast<int>(y));
    }
}

bool VirtualTexture::is_pending(const TileKey& key) const {
    return std::find(pending_.begin(), pending_.end(), key) != pending_.end();
}

void VirtualTexture::request_tile(int lod, int tile_x, int tile_y) {
    check_lod(lod);
    const TileKey key{lod, tile_x, tile_y};
    if (cache_.contains(key) || is_pending(key)) return;
    pending_.push_back(key);
}

void VirtualTexture::update([[maybe_unused]] double dt) {
    computed_this_frame_ = 0;
    while (!pending_.empty() && computed_this_frame_ < config_.max_tiles_per_frame) {
        const TileKey key = pending_.front();
        pending_.pop_front();
        compute_tile(key);
        computed_this_frame_++;
    }
    cache_.advance_frame();
}

void VirtualTexture::compute_tile(const TileKey& key) {
    const Tile& tile = cache_.allocate(key, {cache_.current_frame(), ++computed_total_});
    try {
        backend_.compute(key, footprint(key), tile.slot);
    } catch (const std::exception&) {
        // The slot keeps its new key with undefined contents; retrying is up
        // to the integration layer.
        dispatch_failures_++;
    }
}

const Tile* VirtualTexture::get_tile(int lod, int tile_x, int tile_y) {
    if (lod < 0) return nullptr;
    for (int l = lod; l <= config_.max_lod; l++) {
        if (Tile* tile = cache_.get({l, tile_x, tile_y})) {
            cache_.touch(*tile);
            return tile;
        }
        tile_x = floor_half(tile_x);
        tile_y = floor_half(tile_y);
    }
    return nullptr;
}

void VirtualTexture::invalidate() {
    cache_.clear();
    pending_.clear();
}

VirtualTextureStats VirtualTexture::stats() const {
    const auto cs = cache_.stats();
    return {cs.size, pending_.size(), computed_this_frame_, computed_total_,
            dispatch_failures_, cs.evictions, cache_.current_frame()};
}

} // namespace contourfield::vtex
