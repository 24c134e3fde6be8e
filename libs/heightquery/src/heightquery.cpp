#include <contourfield/heightquery.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cmath>
#include <limits>

namespace contourfield::heightquery {

namespace {

// ForEachEdge walks the contour's slice of the shared point array as closed edges.
template <typename Fn>
void for_each_edge(const flatfield::FlattenedField& field, const flatfield::Entry& e, Fn&& fn) {
    const uint32_t n = e.point_count;
    if (n == 0) return;
    const geometry::Point* base = field.points.data() + e.point_start;
    const geometry::Point* a = base + (n - 1);
    for (uint32_t i = 0; i < n; i++) {
        const geometry::Point* b = base + i;
        fn(*a, *b);
        a = b;
    }
}

bool inside(const flatfield::FlattenedField& field, const flatfield::Entry& e, const geometry::Point& p) {
    if (!e.bbox.contains(p)) return false;

    int winding = 0;
    for_each_edge(field, e, [&](const geometry::Point& a, const geometry::Point& b) {
        const double cross = (b[0] - a[0]) * (p[1] - a[1]) - (p[0] - a[0]) * (b[1] - a[1]);
        if (a[1] <= p[1]) {
            if (b[1] > p[1] && cross > 0) winding++;
        } else {
            if (b[1] <= p[1] && cross < 0) winding--;
        }
    });
    return winding != 0;
}

double boundary_distance(const flatfield::FlattenedField& field, const flatfield::Entry& e, const geometry::Point& p) {
    double min_sq = std::numeric_limits<double>::infinity();
    for_each_edge(field, e, [&](const geometry::Point& a, const geometry::Point& b) {
        min_sq = std::min(min_sq, geometry::segment_distance_sq(p, a, b));
    });
    return std::sqrt(min_sq);
}

} // namespace

bool is_inside_contour(const flatfield::FlattenedField& field, int index, const geometry::Point& p) {
    return inside(field, field.entries[static_cast<size_t>(index)], p);
}

double distance_to_boundary(const flatfield::FlattenedField& field, int index, const geometry::Point& p) {
    return boundary_distance(field, field.entries[static_cast<size_t>(index)], p);
}

int find_deepest(const flatfield::FlattenedField& field, const geometry::Point& p) {
    const auto& entries = field.entries;
    int deepest = -1;
    int deepest_depth = 0;
    size_t i = 0;
    size_t last = entries.size();

    while (i < last) {
        const auto& e = entries[i];
        if (inside(field, e, p)) {
            if (e.depth >= deepest_depth) {
                deepest_depth = e.depth;
                deepest = static_cast<int>(i);
            }
            // Only this contour's descendants can hold a deeper match.
            last = i + e.skip_count + 1;
            i += 1;
        } else {
            i += e.skip_count + 1;
        }
    }
    return deepest;
}

double compute_height_at(const flatfield::FlattenedField& field, const geometry::Point& p) {
    const int deepest = find_deepest(field, p);
    if (deepest < 0) return field.default_height;

    const auto& parent = field.entries[static_cast<size_t>(deepest)];
    if (parent.child_count == 0) return parent.height;

    const double parent_weight = 1.0 / std::max(boundary_distance(field, parent, p), idw_min_distance);
    double total_weight = parent_weight;
    double weighted_sum = parent.height * parent_weight;

    for (uint32_t c = 0; c < parent.child_count; c++) {
        const auto& child = field.entries[field.children[parent.child_start + c]];
        const double w = 1.0 / std::max(boundary_distance(field, child, p), idw_min_distance);
        total_weight += w;
        weighted_sum += child.height * w;
    }
    return weighted_sum / total_weight;
}

} // namespace contourfield::heightquery
