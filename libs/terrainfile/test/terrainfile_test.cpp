#include "contourfield/terrainfile.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace {

namespace fs = std::filesystem;
namespace tf = contourfield::terrainfile;
using json = nlohmann::json;

fs::path unique_test_root() {
    const auto base = fs::temp_directory_path() / "contourfield-terrainfile-tests";
    const auto unique = base / std::to_string(static_cast<unsigned long long>(std::rand()));
    fs::create_directories(unique);
    return unique;
}

void write_text_file(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    ASSERT_TRUE(out.is_open());
    out << text;
}

json island_doc() {
    return json::parse(R"({
        "version": 1,
        "defaultDepth": -40,
        "contours": [
            {"name": "island", "height": 0, "points": [[-10, -10], [10, -10], [10, 10], [-10, 10]]},
            {"name": "hill", "height": 5, "points": [[-3, -3], [-3, 3], [3, 3], [3, -3]]}
        ],
        "streaming": {"tileSize": 64, "maxTiles": 32, "tilesPerFrame": 2, "maxLod": 5}
    })");
}

std::string error_of(const json& j) {
    try {
        (void)tf::parse(j);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return {};
}

}  // namespace

TEST(TerrainFile, ParsesDocument) {
    const auto def = tf::parse(island_doc());
    EXPECT_EQ(def.version, 1);
    EXPECT_DOUBLE_EQ(def.default_depth, -40.0);
    ASSERT_EQ(def.contours.size(), 2u);
    EXPECT_EQ(def.contours[0].name, "island");
    EXPECT_DOUBLE_EQ(def.contours[1].height, 5.0);
    EXPECT_DOUBLE_EQ(def.contours[0].bbox.max_x, 10.0);
    EXPECT_EQ(def.streaming.tile_size, 64);
    EXPECT_EQ(def.streaming.max_tiles, 32u);
    EXPECT_EQ(def.streaming.tiles_per_frame, 2);
    EXPECT_EQ(def.streaming.max_lod, 5);
}

TEST(TerrainFile, MissingOptionalKeysUseDefaults) {
    const auto def = tf::parse(json::parse(R"({"contours": []})"));
    EXPECT_EQ(def.version, tf::format_version);
    EXPECT_DOUBLE_EQ(def.default_depth, -50.0);
    EXPECT_TRUE(def.contours.empty());
    EXPECT_EQ(def.streaming.tile_size, 128);
    EXPECT_EQ(def.streaming.max_tiles, 512u);
}

TEST(TerrainFile, NormalizesWindingOnRequest) {
    // The hill is listed clockwise.
    EXPECT_FALSE(contourfield::geometry::is_ccw(tf::parse(island_doc()).contours[1].points));

    tf::LoadOptions options;
    options.normalize_winding = true;
    const auto def = tf::parse(island_doc(), options);
    EXPECT_TRUE(contourfield::geometry::is_ccw(def.contours[0].points));
    EXPECT_TRUE(contourfield::geometry::is_ccw(def.contours[1].points));
}

TEST(TerrainFile, RejectsNewerVersion) {
    auto doc = island_doc();
    doc["version"] = tf::format_version + 1;
    const auto msg = error_of(doc);
    EXPECT_EQ(msg.rfind("terrainfile:", 0), 0u) << msg;
    EXPECT_NE(msg.find("newer"), std::string::npos) << msg;
}

TEST(TerrainFile, RejectsMissingContours) {
    EXPECT_NE(error_of(json::parse(R"({"version": 1})")).find("missing contours"), std::string::npos);
    EXPECT_NE(error_of(json::parse(R"({"contours": {}})")).find("missing contours"), std::string::npos);
}

TEST(TerrainFile, RejectsMalformedPoints) {
    auto doc = island_doc();
    doc["contours"][1]["points"][2] = json::array({1.0});
    EXPECT_NE(error_of(doc).find("contour 1 point 2"), std::string::npos);

    doc = island_doc();
    doc["contours"][0]["points"][0] = json::array({"a", "b"});
    EXPECT_NE(error_of(doc).find("contour 0 point 0"), std::string::npos);

    doc = island_doc();
    doc["contours"][0].erase("height");
    EXPECT_NE(error_of(doc).find("height"), std::string::npos);
}

TEST(TerrainFile, WrongTypedFieldIsFormatError) {
    auto doc = island_doc();
    doc["streaming"]["tileSize"] = "big";
    EXPECT_EQ(error_of(doc).rfind("terrainfile:", 0), 0u);
}

TEST(TerrainFile, RejectsNonPositiveStreamingCounts) {
    for (const char* key : {"tileSize", "maxTiles", "tilesPerFrame"}) {
        auto doc = island_doc();
        doc["streaming"][key] = -1;
        auto msg = error_of(doc);
        EXPECT_EQ(msg.rfind("terrainfile:", 0), 0u) << key;
        EXPECT_NE(msg.find(key), std::string::npos) << msg;

        doc["streaming"][key] = 0;
        EXPECT_NE(error_of(doc).find(key), std::string::npos) << key;
    }

    auto doc = island_doc();
    doc["streaming"]["maxTiles"] = 1ull << 40;
    EXPECT_NE(error_of(doc).find("maxTiles"), std::string::npos);

    doc = island_doc();
    doc["streaming"]["maxLod"] = -1;
    EXPECT_NE(error_of(doc).find("maxLod"), std::string::npos);

    doc = island_doc();
    doc["streaming"]["tilesPerFrame"] = 2.5;
    EXPECT_NE(error_of(doc).find("expected an integer"), std::string::npos);
}

TEST(TerrainFile, AcceptsBoundaryStreamingValues) {
    auto doc = island_doc();
    doc["streaming"] = {{"tileSize", 1}, {"maxTiles", 1}, {"tilesPerFrame", 1}, {"maxLod", 0}};
    const auto def = tf::parse(doc);
    EXPECT_EQ(def.streaming.tile_size, 1);
    EXPECT_EQ(def.streaming.max_tiles, 1u);
    EXPECT_EQ(def.streaming.tiles_per_frame, 1);
    EXPECT_EQ(def.streaming.max_lod, 0);
}

TEST(TerrainFile, SaveThenLoadFromDisk) {
    const auto root = unique_test_root();
    const auto path = root / "terrain.json";

    auto def = tf::parse(island_doc());
    tf::save(path.string(), def);
    const auto loaded = tf::load(path.string());

    EXPECT_DOUBLE_EQ(loaded.default_depth, def.default_depth);
    ASSERT_EQ(loaded.contours.size(), def.contours.size());
    EXPECT_EQ(loaded.contours[1].points, def.contours[1].points);
    EXPECT_EQ(loaded.streaming.max_lod, def.streaming.max_lod);

    fs::remove_all(root);
}

TEST(TerrainFile, LoadReportsUnreadableFiles) {
    const auto root = unique_test_root();
    EXPECT_THROW(tf::load((root / "absent.json").string()), std::runtime_error);

    write_text_file(root / "broken.json", "{ \"contours\": [");
    try {
        (void)tf::load((root / "broken.json").string());
        FAIL() << "expected a parse error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("terrainfile:", 0), 0u);
    }

    fs::remove_all(root);
}

TEST(TerrainFile, StreamingSettingsMapToVirtualTextureConfig) {
    const auto def = tf::parse(island_doc());
    const auto cfg = tf::to_vtex_config(def.streaming, "island");
    EXPECT_EQ(cfg.tile_size, 64);
    EXPECT_EQ(cfg.max_tiles, 32u);
    EXPECT_EQ(cfg.max_tiles_per_frame, 2);
    EXPECT_EQ(cfg.max_lod, 5);
    EXPECT_EQ(cfg.label, "island");
}
