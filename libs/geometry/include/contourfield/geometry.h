#pragma once

#include <array>
#include <vector>

namespace contourfield::geometry {

using Point = std::array<double, 2>;

struct BBox {
    double min_x = 0, min_y = 0, max_x = 0, max_y = 0;

    [[nodiscard]] bool contains(const Point& p) const;
    [[nodiscard]] bool contains(const BBox& other) const;
    [[nodiscard]] double width() const { return max_x - min_x; }
    [[nodiscard]] double height() const { return max_y - min_y; }
};

// Intersection is a crossing between segment_a of one loop and segment_b of
// another (or the same) loop. Segment i runs from point i to point i+1.
struct Intersection {
    Point point{};
    int segment_a = 0;
    int segment_b = 0;
};

// BoundingBox returns the tight box around points. Empty input yields a zero box.
BBox bounding_box(const std::vector<Point>& points);

// PointInPolygon tests p against a closed loop using the winding number.
// The bbox is an early reject and must enclose the loop.
bool point_in_polygon(const Point& p, const std::vector<Point>& points, const BBox& bbox);
bool point_in_polygon(const Point& p, const std::vector<Point>& points);

// SegmentDistanceSq is the squared distance from p to segment [a, b].
double segment_distance_sq(const Point& p, const Point& a, const Point& b);

// DistanceToBoundary is the minimum distance from p to any edge of the loop.
double distance_to_boundary(const Point& p, const std::vector<Point>& points);

// SegmentsIntersect reports a proper crossing of [a0, a1] and [b0, b1].
// Touching endpoints and collinear overlaps are not reported.
bool segments_intersect(const Point& a0, const Point& a1,
                        const Point& b0, const Point& b1, Point* out = nullptr);

// PolygonInsidePolygon is true when no edges cross and every inner point lies
// inside outer.
bool polygon_inside_polygon(const std::vector<Point>& inner, const BBox& inner_bbox,
                            const std::vector<Point>& outer, const BBox& outer_bbox);

std::vector<Intersection> self_intersections(const std::vector<Point>& points);
std::vector<Intersection> polygon_intersections(const std::vector<Point>& a,
                                                const std::vector<Point>& b);

// SignedArea uses the shoelace formula. Positive means counter-clockwise in a
// y-up frame.
double signed_area(const std::vector<Point>& points);
bool is_ccw(const std::vector<Point>& points);
void ensure_ccw(std::vector<Point>& points);

} // namespace contourfield::geometry
