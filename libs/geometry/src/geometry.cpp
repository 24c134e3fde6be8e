#include <contourfield/geometry.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace contourfield::geometry {

bool BBox::contains(const Point& p) const {
    return p[0] >= min_x && p[0] <= max_x && p[1] >= min_y && p[1] <= max_y;
}

bool BBox::contains(const BBox& other) const {
    return other.min_x >= min_x && other.max_x <= max_x &&
           other.min_y >= min_y && other.max_y <= max_y;
}

BBox bounding_box(const std::vector<Point>& points) {
    if (points.empty()) return {};
    BBox b{points[0][0], points[0][1], points[0][0], points[0][1]};
    for (const auto& p : points) {
        b.min_x = std::min(b.min_x, p[0]);
        b.min_y = std::min(b.min_y, p[1]);
        b.max_x = std::max(b.max_x, p[0]);
        b.max_y = std::max(b.max_y, p[1]);
    }
    return b;
}

// ---------------------------------------------------------------------------
// Containment
// ---------------------------------------------------------------------------

static double left_of(const Point& a, const Point& b, const Point& p) {
    return (b[0] - a[0]) * (p[1] - a[1]) - (p[0] - a[0]) * (b[1] - a[1]);
}

bool point_in_polygon(const Point& p, const std::vector<Point>& points, const BBox& bbox) {
    if (!bbox.contains(p)) return false;

    const size_t n = points.size();
    if (n < 3) return false;

    int winding = 0;
    const Point* a = &points[n - 1];
    for (size_t i = 0; i < n; i++) {
        const Point* b = &points[i];
        if ((*a)[1] <= p[1]) {
            if ((*b)[1] > p[1] && left_of(*a, *b, p) > 0) winding++;
        } else {
            if ((*b)[1] <= p[1] && left_of(*a, *b, p) < 0) winding--;
        }
        a = b;
    }
    return winding != 0;
}

bool point_in_polygon(const Point& p, const std::vector<Point>& points) {
    return point_in_polygon(p, points, bounding_box(points));
}

// ---------------------------------------------------------------------------
// Distance
// ---------------------------------------------------------------------------

double segment_distance_sq(const Point& p, const Point& a, const Point& b) {
    const double abx = b[0] - a[0];
    const double aby = b[1] - a[1];
    const double len_sq = abx * abx + aby * aby;

    double nx = a[0];
    double ny = a[1];
    if (len_sq > 0) {
        double t = ((p[0] - a[0]) * abx + (p[1] - a[1]) * aby) / len_sq;
        t = std::clamp(t, 0.0, 1.0);
        nx += t * abx;
        ny += t * aby;
    }
    const double dx = p[0] - nx;
    const double dy = p[1] - ny;
    return dx * dx + dy * dy;
}

double distance_to_boundary(const Point& p, const std::vector<Point>& points) {
    const size_t n = points.size();
    if (n == 0) return std::numeric_limits<double>::infinity();

    double min_sq = std::numeric_limits<double>::infinity();
    const Point* a = &points[n - 1];
    for (size_t i = 0; i < n; i++) {
        const Point* b = &points[i];
        min_sq = std::min(min_sq, segment_distance_sq(p, *a, *b));
        a = b;
    }
    return std::sqrt(min_sq);
}

// ---------------------------------------------------------------------------
// Intersections
// ---------------------------------------------------------------------------

bool segments_intersect(const Point& a0, const Point& a1,
                        const Point& b0, const Point& b1, Point* out) {
    const double rx = a1[0] - a0[0];
    const double ry = a1[1] - a0[1];
    const double sx = b1[0] - b0[0];
    const double sy = b1[1] - b0[1];

    const double denom = rx * sy - ry * sx;
    if (denom == 0) return false;

    const double qpx = b0[0] - a0[0];
    const double qpy = b0[1] - a0[1];
    const double t = (qpx * sy - qpy * sx) / denom;
    const double u = (qpx * ry - qpy * rx) / denom;

    // Strict interior on both segments; shared vertices are not crossings.
    if (t <= 0 || t >= 1 || u <= 0 || u >= 1) return false;

    if (out) *out = {a0[0] + t * rx, a0[1] + t * ry};
    return true;
}

std::vector<Intersection> self_intersections(const std::vector<Point>& points) {
    std::vector<Intersection> result;
    const int n = static_cast<int>(points.size());
    if (n < 4) return result;

    for (int i = 0; i < n; i++) {
        const Point& a0 = points[static_cast<size_t>(i)];
        const Point& a1 = points[static_cast<size_t>((i + 1) % n)];
        // Skip the adjacent segments, they share a vertex with segment i.
        for (int j = i + 2; j < n; j++) {
            if (i == 0 && j == n - 1) continue;
            const Point& b0 = points[static_cast<size_t>(j)];
            const Point& b1 = points[static_cast<size_t>((j + 1) % n)];
            Point hit{};
            if (segments_intersect(a0, a1, b0, b1, &hit)) {
                result.push_back({hit, i, j});
            }
        }
    }
    return result;
}

std::vector<Intersection> polygon_intersections(const std::vector<Point>& a,
                                                const std::vector<Point>& b) {
    std::vector<Intersection> result;
    const size_t na = a.size();
    const size_t nb = b.size();
    if (na < 2 || nb < 2) return result;

    const BBox ba = bounding_box(a);
    const BBox bb = bounding_box(b);
    if (ba.max_x < bb.min_x || bb.max_x < ba.min_x ||
        ba.max_y < bb.min_y || bb.max_y < ba.min_y) {
        return result;
    }

    for (size_t i = 0; i < na; i++) {
        const Point& a0 = a[i];
        const Point& a1 = a[(i + 1) % na];
        for (size_t j = 0; j < nb; j++) {
            Point hit{};
            if (segments_intersect(a0, a1, b[j], b[(j + 1) % nb], &hit)) {
                result.push_back({hit, static_cast<int>(i), static_cast<int>(j)});
            }
        }
    }
    return result;
}

bool polygon_inside_polygon(const std::vector<Point>& inner, const BBox& inner_bbox,
                            const std::vector<Point>& outer, const BBox& outer_bbox) {
    if (inner.empty() || outer.size() < 3) return false;
    if (!outer_bbox.contains(inner_bbox)) return false;

    for (const auto& p : inner) {
        if (!point_in_polygon(p, outer, outer_bbox)) return false;
    }
    return polygon_intersections(inner, outer).empty();
}

// ---------------------------------------------------------------------------
// Winding
// ---------------------------------------------------------------------------

double signed_area(const std::vector<Point>& points) {
    const size_t n = points.size();
    if (n < 3) return 0;

    double area = 0;
    for (size_t i = 0; i < n; i++) {
        const Point& p = points[i];
        const Point& q = points[(i + 1) % n];
        area += p[0] * q[1] - q[0] * p[1];
    }
    return area / 2;
}

bool is_ccw(const std::vector<Point>& points) {
    return signed_area(points) > 0;
}

void ensure_ccw(std::vector<Point>& points) {
    if (points.size() >= 3 && !is_ccw(points)) {
        std::reverse(points.begin(), points.end());
    }
}

} // namespace contourfield::geometry
