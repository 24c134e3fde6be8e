#pragma once

#include <contourfield/contourtree.h>
#include <contourfield/geometry.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace contourfield::flatfield {

// Baseline height for points outside every contour.
constexpr double default_depth = -50.0;

// Words per contour in the packed backend buffer.
constexpr size_t words_per_contour = 13;

// Entry is one contour in DFS pre-order. Index fields are DFS positions, so
// entries [i+1, i+skip_count] are exactly the descendants of entry i.
struct Entry {
    double height = 0;
    int parent_index = -1;
    int depth = 0;
    uint32_t child_start = 0;
    uint32_t child_count = 0;
    uint32_t point_start = 0;
    uint32_t point_count = 0;
    uint32_t skip_count = 0;
    geometry::BBox bbox;
    int contour_index = -1;
    bool is_coastline = false;
};

struct FlattenedField {
    std::vector<Entry> entries;
    std::vector<geometry::Point> points;
    std::vector<uint32_t> children;
    std::vector<uint32_t> coastlines;
    double default_height = default_depth;
    int max_depth = 0;

    [[nodiscard]] size_t size() const { return entries.size(); }
    [[nodiscard]] bool empty() const { return entries.empty(); }
};

// Compile walks the tree depth-first and lays it out for stackless traversal.
FlattenedField compile(const contourtree::ContourTree& tree, double default_height = default_depth);

// PackedField mirrors the buffers a data-parallel backend binds.
// Contour layout, 13 little-endian 32-bit words:
//   0 point_start      1 point_count    2 height (f32)   3 parent (i32)
//   4 depth            5 child_start    6 child_count    7 is_coastline
//   8 bbox min x (f32) 9 bbox min y     10 bbox max x    11 bbox max y
//   12 skip_count
struct PackedField {
    std::vector<uint32_t> contours;
    std::vector<float> vertices;
    std::vector<uint32_t> children;
    std::vector<uint32_t> coastlines;
    uint32_t contour_count = 0;
    uint32_t max_depth = 0;
    float default_height = 0;
};

PackedField pack(const FlattenedField& field);

// SkipCountsConsistent checks every skip range against the parent links.
bool skip_counts_consistent(const FlattenedField& field);

// IsDescendant walks parent links from candidate toward the root.
bool is_descendant(const FlattenedField& field, int candidate, int ancestor);

} // namespace contourfield::flatfield
