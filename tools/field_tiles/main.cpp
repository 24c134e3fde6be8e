#include "contourfield/contourtree.h"
#include "contourfield/terrain.h"
#include "contourfield/terrainfile.h"
#include "contourfield/vtex.h"
#include "../common/cli_logger.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <format>
#include <fstream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace ct = contourfield::contourtree;
namespace tf = contourfield::terrainfile;
namespace vt = contourfield::vtex;

// Frames to run when --frames is not given and the queue never drains.
static constexpr int max_auto_frames = 100000;

// Largest mosaic, in tiles, the tool will assemble.
static constexpr size_t max_mosaic_tiles = 1 << 16;

static void print_usage() {
    contourfield::cli::print("Usage: field_tiles [flags] <terrain.json> <output.rawf32>");
    contourfield::cli::print("");
    contourfield::cli::print("Streams a world rectangle through the virtual texture and writes the");
    contourfield::cli::print("resident tiles as a row-major float32 mosaic (NaN where nothing is resident).");
    contourfield::cli::print("");
    contourfield::cli::print("Flags:");
    contourfield::cli::print("  --rect <minx> <miny> <maxx> <maxy>  World rectangle to stream (required)");
    contourfield::cli::print("  --lod <n>                           Level of detail (default: 0)");
    contourfield::cli::print("  --frames <n>                        Updates to run (default: until the queue drains)");
    contourfield::cli::print("  --tile-size <n>                     Override streaming tileSize");
    contourfield::cli::print("  --max-tiles <n>                     Override streaming maxTiles");
    contourfield::cli::print("  --budget <n>                        Override streaming tilesPerFrame");
    contourfield::cli::print("  -v, --verbose                       Verbose logging");
    contourfield::cli::print("  -vv, --debug                        Debug logging");
}

// Samples the resident tile covering a fine texel, which may belong to a
// coarser level than requested.
static float sample_tile(const contourfield::terrain::TerrainField& terrain, const vt::Tile& tile,
                         const vt::TileFootprint& fp, double wx, double wy) {
    const int n = fp.tile_size;
    const int x = std::clamp(static_cast<int>(std::floor((wx - fp.origin_x) / fp.texel_size())), 0, n - 1);
    const int y = std::clamp(static_cast<int>(std::floor((wy - fp.origin_y) / fp.texel_size())), 0, n - 1);
    return terrain.sample(tile, x, y);
}

int main(int argc, char* argv[]) {
    contourfield::geometry::BBox rect;
    bool have_rect = false;
    int lod = 0;
    int frames = -1;
    int tile_size = 0;
    long long max_tiles = 0;
    int budget = 0;
    int verbosity = 0;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; i++) {
            if (std::strcmp(argv[i], "--rect") == 0 && i + 4 < argc) {
                rect = {std::stod(argv[i + 1]), std::stod(argv[i + 2]), std::stod(argv[i + 3]), std::stod(argv[i + 4])};
                have_rect = true;
                i += 4;
            } else if (std::strcmp(argv[i], "--lod") == 0 && i + 1 < argc) {
                lod = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--frames") == 0 && i + 1 < argc) {
                frames = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--tile-size") == 0 && i + 1 < argc) {
                tile_size = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--max-tiles") == 0 && i + 1 < argc) {
                max_tiles = std::stoll(argv[++i]);
            } else if (std::strcmp(argv[i], "--budget") == 0 && i + 1 < argc) {
                budget = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
                verbosity = std::min(verbosity + 1, 2);
            } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
                verbosity = 2;
            } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
                print_usage();
                return 0;
            } else {
                positional.push_back(argv[i]);
            }
        }
    } catch (const std::exception& e) {
        LOGE("invalid numeric argument:", e.what());
        return 1;
    }

    contourfield::cli::set_verbosity(verbosity);

    if (positional.size() != 2 || !have_rect) {
        print_usage();
        return 1;
    }
    if (rect.max_x < rect.min_x || rect.max_y < rect.min_y) {
        LOGE("--rect max must not be below min");
        return 1;
    }
    const std::string& input_path = positional[0];
    const std::string& output_path = positional[1];

    tf::TerrainDefinition def;
    try {
        def = tf::load(input_path);
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }

    if (tile_size > 0) def.streaming.tile_size = tile_size;
    if (max_tiles > 0) def.streaming.max_tiles = static_cast<size_t>(max_tiles);
    if (budget > 0) def.streaming.tiles_per_frame = budget;

    try {
        contourfield::terrain::TerrainField terrain(std::move(def));
        for (const auto& d : terrain.tree().diagnostics())
            LOGW(ct::diagnostic_kind_name(d.kind), d.contour_a, d.message);
        LOGI("compiled", terrain.field().size(), "contours, max depth", terrain.field().max_depth);

        const auto& texture = terrain.texture();
        const vt::TileRange range = texture.tile_range(rect, lod);
        const size_t cols = static_cast<size_t>(static_cast<int64_t>(range.max_x) - range.min_x + 1);
        const size_t rows = static_cast<size_t>(static_cast<int64_t>(range.max_y) - range.min_y + 1);
        if (cols > max_mosaic_tiles || rows > max_mosaic_tiles || cols * rows > max_mosaic_tiles) {
            LOGE(std::format("rect spans {}x{} tiles at lod {}; limit is {}", cols, rows, lod, max_mosaic_tiles));
            return 1;
        }
        terrain.request_tiles_for_rect(rect, lod);
        LOGI("queued", texture.pending().size(), "tiles at lod", lod);

        const int limit = frames >= 0 ? frames : max_auto_frames;
        int ran = 0;
        while (ran < limit && (frames >= 0 || !texture.pending().empty())) {
            terrain.tick(1.0 / 60.0);
            ran++;
            LOGD_RATE_LIMIT(250, "frame", texture.stats().frame, "computed", texture.stats().computed_this_frame,
                            "pending", texture.stats().pending, "cached", texture.stats().cached);
        }

        const int n = texture.config().tile_size;
        const size_t width = cols * static_cast<size_t>(n);
        const size_t height = rows * static_cast<size_t>(n);

        std::vector<float> mosaic(width * height, std::numeric_limits<float>::quiet_NaN());
        int missing = 0;
        int fallbacks = 0;
        for (int ty = range.min_y; ty <= range.max_y; ty++) {
            for (int tx = range.min_x; tx <= range.max_x; tx++) {
                const vt::Tile* tile = terrain.get_tile(lod, tx, ty);
                if (!tile) {
                    missing++;
                    continue;
                }
                if (tile->key.lod != lod) fallbacks++;

                const auto cell = texture.footprint({lod, tx, ty});
                const auto source = texture.footprint(tile->key);
                const size_t col0 = static_cast<size_t>(tx - range.min_x) * static_cast<size_t>(n);
                const size_t row0 = static_cast<size_t>(ty - range.min_y) * static_cast<size_t>(n);
                for (int y = 0; y < n; y++) {
                    const double wy = cell.origin_y + (y + 0.5) * cell.texel_size();
                    for (int x = 0; x < n; x++) {
                        const double wx = cell.origin_x + (x + 0.5) * cell.texel_size();
                        mosaic[(row0 + static_cast<size_t>(y)) * width + col0 + static_cast<size_t>(x)] =
                            sample_tile(terrain, *tile, source, wx, wy);
                    }
                }
            }
        }

        std::ofstream out(output_path, std::ios::binary);
        if (!out) {
            LOGE("cannot create", output_path);
            return 1;
        }
        out.write(reinterpret_cast<const char*>(mosaic.data()),
                  static_cast<std::streamsize>(mosaic.size() * sizeof(float)));
        if (!out) {
            LOGE("write failed for", output_path);
            return 1;
        }

        const auto s = texture.stats();
        contourfield::cli::print(std::format("{}: {}x{} float32, lod {}, {} frames", output_path, width, height, lod, ran));
        contourfield::cli::print(std::format("tiles: {} cached, {} pending, {} computed, {} evicted, {} failed",
                                             s.cached, s.pending, s.computed_total, s.evictions, s.dispatch_failures));
        contourfield::cli::print(std::format("cells: {} fallback, {} missing", fallbacks, missing));
        if (s.pending > 0) LOGW(s.pending, "tiles still pending; raise --frames or --budget");
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }

    return 0;
}
