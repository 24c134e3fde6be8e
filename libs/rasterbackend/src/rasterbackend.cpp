#include <contourfield/rasterbackend.h>

#include <contourfield/heightquery.h>

#include <format>
#include <stdexcept>

namespace contourfield::rasterbackend {

// ---------------------------------------------------------------------------
// SlotArray
// ---------------------------------------------------------------------------

SlotArray::SlotArray(int tile_size, size_t capacity)
    : tile_size_(tile_size), capacity_(capacity) {
    if (tile_size <= 0) throw std::invalid_argument("SlotArray: tile_size must be positive");
    if (capacity == 0) throw std::invalid_argument("SlotArray: capacity must be greater than zero");
    data_.assign(texels_per_slot() * capacity_, 0.0f);
}

size_t SlotArray::texels_per_slot() const {
    return static_cast<size_t>(tile_size_) * static_cast<size_t>(tile_size_);
}

std::span<float> SlotArray::slot(vtex::SlotIndex index) {
    if (index.value() >= capacity_)
        throw std::out_of_range(std::format("SlotArray: slot {} beyond capacity {}", index.value(), capacity_));
    return {data_.data() + index.value() * texels_per_slot(), texels_per_slot()};
}

std::span<const float> SlotArray::slot(vtex::SlotIndex index) const {
    if (index.value() >= capacity_)
        throw std::out_of_range(std::format("SlotArray: slot {} beyond capacity {}", index.value(), capacity_));
    return {data_.data() + index.value() * texels_per_slot(), texels_per_slot()};
}

float SlotArray::at(vtex::SlotIndex index, int x, int y) const {
    if (x < 0 || y < 0 || x >= tile_size_ || y >= tile_size_)
        throw std::out_of_range(std::format("SlotArray: texel ({}, {}) outside tile", x, y));
    return slot(index)[static_cast<size_t>(y) * static_cast<size_t>(tile_size_) + static_cast<size_t>(x)];
}

// ---------------------------------------------------------------------------
// CpuTileBackend
// ---------------------------------------------------------------------------

CpuTileBackend::CpuTileBackend(const flatfield::FlattenedField& field, SlotArray& slots)
    : field_(field), slots_(slots) {}

void CpuTileBackend::compute([[maybe_unused]] const vtex::TileKey& key,
                             const vtex::TileFootprint& footprint, vtex::SlotIndex slot) {
    if (footprint.tile_size != slots_.tile_size())
        throw std::invalid_argument(std::format("CpuTileBackend: footprint tile size {} does not match array {}",
                                                footprint.tile_size, slots_.tile_size()));
    auto out = slots_.slot(slot);
    const int n = footprint.tile_size;
    const double texel = footprint.texel_size();

    for (int y = 0; y < n; y++) {
        const double wy = footprint.origin_y + (y + 0.5) * texel;
        for (int x = 0; x < n; x++) {
            const double wx = footprint.origin_x + (x + 0.5) * texel;
            out[static_cast<size_t>(y) * static_cast<size_t>(n) + static_cast<size_t>(x)] =
                static_cast<float>(heightquery::compute_height_at(field_, {wx, wy}));
        }
    }
    dispatches_++;
}

} // namespace contourfield::rasterbackend
