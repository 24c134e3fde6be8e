#pragma once

#include <contourfield/contourtree.h>
#include <contourfield/flatfield.h>
#include <contourfield/vtex.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace contourfield::terrainfile {

// Newest format version this reader understands.
constexpr int format_version = 1;

struct StreamingSettings {
    int tile_size = 128;
    size_t max_tiles = 512;
    int tiles_per_frame = 8;
    int max_lod = 8;

    bool operator==(const StreamingSettings&) const = default;
};

struct TerrainDefinition {
    int version = format_version;
    double default_depth = flatfield::default_depth;
    std::vector<contourtree::Contour> contours;
    StreamingSettings streaming;
};

struct LoadOptions {
    // Reverse clockwise loops so every contour winds counter-clockwise.
    bool normalize_winding = false;
};

// Parse reads a terrain document. Throws std::runtime_error on a newer
// version, a missing contour list or malformed points.
TerrainDefinition parse(const nlohmann::json& j, const LoadOptions& options = {});

TerrainDefinition load(const std::string& path, const LoadOptions& options = {});

nlohmann::json to_json(const TerrainDefinition& def);
void save(const std::string& path, const TerrainDefinition& def);

vtex::VirtualTextureConfig to_vtex_config(const StreamingSettings& settings, std::string label = "VirtualTexture");

} // namespace contourfield::terrainfile
