#include <contourfield/terrainfile.h>

#include <cstdint>
#include <format>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace contourfield::terrainfile {

using json = nlohmann::json;

static std::runtime_error format_error(const std::string& msg) {
    return std::runtime_error("terrainfile: " + msg);
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

static geometry::Point parse_point(const json& j, size_t contour, size_t index) {
    if (!j.is_array() || j.size() != 2 || !j[0].is_number() || !j[1].is_number())
        throw format_error(std::format("contour {} point {}: expected [x, y]", contour, index));
    return {j[0].get<double>(), j[1].get<double>()};
}

static contourtree::Contour parse_contour(const json& j, size_t index, const LoadOptions& options) {
    if (!j.is_object()) throw format_error(std::format("contour {}: expected an object", index));

    std::string name;
    if (j.contains("name")) j.at("name").get_to(name);

    if (!j.contains("height") || !j.at("height").is_number())
        throw format_error(std::format("contour {}: missing numeric height", index));
    const double height = j.at("height").get<double>();

    if (!j.contains("points") || !j.at("points").is_array())
        throw format_error(std::format("contour {}: missing points array", index));

    std::vector<geometry::Point> points;
    const auto& pts = j.at("points");
    points.reserve(pts.size());
    for (size_t i = 0; i < pts.size(); i++) points.push_back(parse_point(pts[i], index, i));

    if (options.normalize_winding) geometry::ensure_ccw(points);
    return contourtree::make_contour(std::move(points), height, std::move(name));
}

// Reads an integer setting and rejects values outside [min, max] rather than
// letting a negative count wrap.
static int64_t streaming_int(const json& j, const char* key, int64_t min, int64_t max) {
    const auto& v = j.at(key);
    if (!v.is_number_integer()) throw format_error(std::format("streaming.{}: expected an integer", key));
    // Non-negative literals parse as unsigned and may exceed int64_t.
    const bool in_range = v.is_number_unsigned()
        ? v.get<uint64_t>() >= static_cast<uint64_t>(min) && v.get<uint64_t>() <= static_cast<uint64_t>(max)
        : v.get<int64_t>() >= min && v.get<int64_t>() <= max;
    if (!in_range)
        throw format_error(std::format("streaming.{}: {} outside [{}, {}]", key, v.dump(), min, max));
    return v.get<int64_t>();
}

static StreamingSettings parse_streaming(const json& j) {
    constexpr int64_t int_max = std::numeric_limits<int>::max();
    constexpr int64_t slot_max = std::numeric_limits<uint32_t>::max();

    StreamingSettings s;
    if (!j.is_object()) throw format_error("streaming: expected an object");
    if (j.contains("tileSize")) s.tile_size = static_cast<int>(streaming_int(j, "tileSize", 1, int_max));
    if (j.contains("maxTiles")) s.max_tiles = static_cast<size_t>(streaming_int(j, "maxTiles", 1, slot_max));
    if (j.contains("tilesPerFrame"))
        s.tiles_per_frame = static_cast<int>(streaming_int(j, "tilesPerFrame", 1, int_max));
    if (j.contains("maxLod")) s.max_lod = static_cast<int>(streaming_int(j, "maxLod", 0, 30));
    return s;
}

TerrainDefinition parse(const json& j, const LoadOptions& options) {
    if (!j.is_object()) throw format_error("document root must be an object");

    TerrainDefinition def;
    try {
        if (j.contains("version")) j.at("version").get_to(def.version);
        if (def.version > format_version)
            throw format_error(std::format("version {} is newer than supported {}", def.version, format_version));
        if (j.contains("defaultDepth")) j.at("defaultDepth").get_to(def.default_depth);
        if (j.contains("streaming")) def.streaming = parse_streaming(j.at("streaming"));
    } catch (const json::exception& e) {
        throw format_error(e.what());
    }

    if (!j.contains("contours") || !j.at("contours").is_array())
        throw format_error("missing contours array");
    const auto& contours = j.at("contours");
    def.contours.reserve(contours.size());
    for (size_t i = 0; i < contours.size(); i++) {
        try {
            def.contours.push_back(parse_contour(contours[i], i, options));
        } catch (const json::exception& e) {
            throw format_error(std::format("contour {}: {}", i, e.what()));
        }
    }
    return def;
}

TerrainDefinition load(const std::string& path, const LoadOptions& options) {
    std::ifstream f(path);
    if (!f.is_open()) throw format_error("cannot open " + path);

    json j;
    try {
        j = json::parse(f);
    } catch (const json::exception& e) {
        throw format_error(std::format("{}: {}", path, e.what()));
    }
    return parse(j, options);
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

json to_json(const TerrainDefinition& def) {
    json contours = json::array();
    for (const auto& c : def.contours) {
        json pts = json::array();
        for (const auto& p : c.points) pts.push_back({p[0], p[1]});
        contours.push_back({{"name", c.name}, {"height", c.height}, {"points", std::move(pts)}});
    }

    json j;
    j["version"] = def.version;
    j["defaultDepth"] = def.default_depth;
    j["contours"] = std::move(contours);
    j["streaming"] = {
        {"tileSize", def.streaming.tile_size},
        {"maxTiles", def.streaming.max_tiles},
        {"tilesPerFrame", def.streaming.tiles_per_frame},
        {"maxLod", def.streaming.max_lod},
    };
    return j;
}

void save(const std::string& path, const TerrainDefinition& def) {
    std::ofstream f(path);
    if (!f.is_open()) throw format_error("cannot write " + path);
    f << to_json(def).dump(2) << "\n";
    if (!f) throw format_error("write failed for " + path);
}

vtex::VirtualTextureConfig to_vtex_config(const StreamingSettings& settings, std::string label) {
    vtex::VirtualTextureConfig cfg;
    cfg.tile_size = settings.tile_size;
    cfg.max_tiles = settings.max_tiles;
    cfg.max_tiles_per_frame = settings.tiles_per_frame;
    cfg.max_lod = settings.max_lod;
    cfg.label = std::move(label);
    return cfg;
}

} // namespace contourfield::terrainfile
