#pragma once

#include <contourfield/flatfield.h>
#include <contourfield/geometry.h>

namespace contourfield::heightquery {

// Lower bound on boundary distance in the IDW weights.
constexpr double idw_min_distance = 0.1;

// IsInsideContour tests p against DFS entry index with a bbox early reject.
bool is_inside_contour(const flatfield::FlattenedField& field, int index, const geometry::Point& p);

double distance_to_boundary(const flatfield::FlattenedField& field, int index, const geometry::Point& p);

// FindDeepest returns the DFS index of the deepest contour containing p, or
// -1. Subtrees whose root misses p are skipped without being visited.
int find_deepest(const flatfield::FlattenedField& field, const geometry::Point& p);

// ComputeHeightAt blends the deepest containing contour with its direct
// children by inverse boundary distance. Outside every contour it returns
// field.default_height.
double compute_height_at(const flatfield::FlattenedField& field, const geometry::Point& p);

} // namespace contourfield::heightquery
