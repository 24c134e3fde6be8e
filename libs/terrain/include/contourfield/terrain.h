#pragma once

#include <contourfield/contourtree.h>
#include <contourfield/flatfield.h>
#include <contourfield/rasterbackend.h>
#include <contourfield/terrainfile.h>
#include <contourfield/vtex.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace contourfield::terrain {

// TerrainField owns one terrain end to end: the containment tree, the
// compiled field, the tile array, the CPU backend and the virtual texture.
// The backend reads the field by reference, so the field is only ever
// replaced through set_definition(), which also drops every resident tile.
class TerrainField {
public:
    explicit TerrainField(terrainfile::TerrainDefinition def);
    ~TerrainField();

    TerrainField(const TerrainField&) = delete;
    TerrainField& operator=(const TerrainField&) = delete;

    // SetDefinition rebuilds the tree and field from def and invalidates the
    // texture. Pending requests are dropped as well. The tile stack is
    // recreated when the streaming settings change.
    void set_definition(terrainfile::TerrainDefinition def);

    [[nodiscard]] double height_at(const geometry::Point& p) const;

    // Coastlines returns the tree indices of contours at height ~0.
    [[nodiscard]] std::vector<int> coastlines() const { return tree_.coastlines(); }

    void request_tiles_for_rect(const geometry::BBox& rect, int lod);
    void tick(double dt);

    [[nodiscard]] const vtex::Tile* get_tile(int lod, int tile_x, int tile_y);

    // Sample reads texel (x, y) of a resident tile.
    [[nodiscard]] float sample(const vtex::Tile& tile, int x, int y) const;

    [[nodiscard]] const terrainfile::TerrainDefinition& definition() const { return def_; }
    [[nodiscard]] const contourtree::ContourTree& tree() const { return tree_; }
    [[nodiscard]] const flatfield::FlattenedField& field() const { return field_; }
    [[nodiscard]] const vtex::VirtualTexture& texture() const { return *texture_; }
    [[nodiscard]] vtex::VirtualTextureStats stats() const { return texture_->stats(); }
    [[nodiscard]] uint64_t generation() const { return generation_; }

private:
    void rebuild_field();
    void create_tile_stack(const terrainfile::StreamingSettings& streaming);

    terrainfile::TerrainDefinition def_;
    contourtree::ContourTree tree_;
    flatfield::FlattenedField field_;
    // Declared in dependency order; destroyed texture first.
    std::unique_ptr<rasterbackend::SlotArray> slots_;
    std::unique_ptr<rasterbackend::CpuTileBackend> backend_;
    std::unique_ptr<vtex::VirtualTexture> texture_;
    uint64_t generation_ = 0;
};

} // namespace contourfield::terrain
