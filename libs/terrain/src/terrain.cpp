#include <contourfield/terrain.h>

#include <contourfield/heightquery.h>

#include <utility>

namespace contourfield::terrain {

TerrainField::TerrainField(terrainfile::TerrainDefinition def) : def_(std::move(def)) {
    rebuild_field();
    create_tile_stack(def_.streaming);
}

TerrainField::~TerrainField() = default;

void TerrainField::rebuild_field() {
    tree_ = contourtree::ContourTree(def_.contours);
    // Assigned in place: the backend holds a reference to field_.
    field_ = flatfield::compile(tree_, def_.default_depth);
}

void TerrainField::create_tile_stack(const terrainfile::StreamingSettings& streaming) {
    auto config = terrainfile::to_vtex_config(streaming, "TerrainField");
    auto slots = std::make_unique<rasterbackend::SlotArray>(config.tile_size, config.max_tiles);
    auto backend = std::make_unique<rasterbackend::CpuTileBackend>(field_, *slots);
    auto texture = std::make_unique<vtex::VirtualTexture>(std::move(config), *backend);

    // Replace consumers before what they reference.
    texture_ = std::move(texture);
    backend_ = std::move(backend);
    slots_ = std::move(slots);
}

void TerrainField::set_definition(terrainfile::TerrainDefinition def) {
    // A rejected streaming config throws before anything is replaced.
    if (def.streaming != def_.streaming) create_tile_stack(def.streaming);
    else texture_->invalidate();

    def_ = std::move(def);
    rebuild_field();
    generation_++;
}

double TerrainField::height_at(const geometry::Point& p) const {
    return heightquery::compute_height_at(field_, p);
}

void TerrainField::request_tiles_for_rect(const geometry::BBox& rect, int lod) {
    texture_->request_tiles_for_rect(rect, lod);
}

void TerrainField::tick(double dt) {
    texture_->update(dt);
}

const vtex::Tile* TerrainField::get_tile(int lod, int tile_x, int tile_y) {
    return texture_->get_tile(lod, tile_x, tile_y);
}

float TerrainField::sample(const vtex::Tile& tile, int x, int y) const {
    return slots_->at(tile.slot, x, y);
}

} // namespace contourfield::terrain
