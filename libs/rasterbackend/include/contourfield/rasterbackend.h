#pragma once

#include <contourfield/flatfield.h>
#include <contourfield/vtex.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace contourfield::rasterbackend {

// SlotArray is the backing texture array: capacity layers of
// tile_size x tile_size float samples, row-major, y rows from the footprint
// origin upward.
class SlotArray {
public:
    SlotArray(int tile_size, size_t capacity);

    [[nodiscard]] int tile_size() const { return tile_size_; }
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] size_t texels_per_slot() const;

    // Slot returns the samples of one layer. Throws std::out_of_range for a
    // slot beyond the array.
    [[nodiscard]] std::span<float> slot(vtex::SlotIndex index);
    [[nodiscard]] std::span<const float> slot(vtex::SlotIndex index) const;

    [[nodiscard]] float at(vtex::SlotIndex index, int x, int y) const;

private:
    int tile_size_;
    size_t capacity_;
    std::vector<float> data_;
};

// CpuTileBackend evaluates the height query at every texel centre of the
// footprint and stores the result in the slot. It completes synchronously.
class CpuTileBackend : public vtex::TileComputeBackend {
public:
    CpuTileBackend(const flatfield::FlattenedField& field, SlotArray& slots);

    void compute(const vtex::TileKey& key, const vtex::TileFootprint& footprint, vtex::SlotIndex slot) override;

    [[nodiscard]] uint64_t dispatch_count() const { return dispatches_; }

private:
    const flatfield::FlattenedField& field_;
    SlotArray& slots_;
    uint64_t dispatches_ = 0;
};

} // namespace contourfield::rasterbackend
