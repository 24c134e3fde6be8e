#include <contourfield/contourtree.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <utility>

namespace contourfield::contourtree {

Contour make_contour(std::vector<geometry::Point> points, double height, std::string name) {
    Contour c;
    c.name = std::move(name);
    c.bbox = geometry::bounding_box(points);
    c.points = std::move(points);
    c.height = height;
    return c;
}

const char* diagnostic_kind_name(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::TooFewPoints: return "too_few_points";
        case DiagnosticKind::SelfIntersection: return "self_intersection";
        case DiagnosticKind::ContourIntersection: return "contour_intersection";
    }
    return "unknown";
}

static Diagnostic too_few_points(int index, const Contour& c) {
    Diagnostic d;
    d.kind = DiagnosticKind::TooFewPoints;
    d.contour_a = index;
    d.count = static_cast<int>(c.points.size());
    d.message = std::format("contour {} at height {} has only {} points", index, c.height, c.points.size());
    return d;
}

// ---------------------------------------------------------------------------
// ContourTree
// ---------------------------------------------------------------------------

ContourTree::ContourTree(const std::vector<Contour>& contours) {
    contours_.reserve(contours.size());
    nodes_.reserve(contours.size());
    for (const auto& c : contours) insert(c);
}

const Contour& ContourTree::contour(int index) const {
    if (index < 0 || static_cast<size_t>(index) >= contours_.size())
        throw std::out_of_range(std::format("contourtree: contour index {} out of range", index));
    return contours_[static_cast<size_t>(index)];
}

const ContourNode& ContourTree::node(int index) const {
    if (index < 0 || static_cast<size_t>(index) >= nodes_.size())
        throw std::out_of_range(std::format("contourtree: node index {} out of range", index));
    return nodes_[static_cast<size_t>(index)];
}

bool ContourTree::encloses(int outer, int inner) const {
    const Contour& o = contours_[static_cast<size_t>(outer)];
    const Contour& i = contours_[static_cast<size_t>(inner)];
    return geometry::polygon_inside_polygon(i.points, i.bbox, o.points, o.bbox);
}

std::vector<int>& ContourTree::children_of(int parent) {
    return parent < 0 ? roots_ : nodes_[static_cast<size_t>(parent)].children;
}

void ContourTree::assign_depths(int index, int depth) {
    std::vector<std::pair<int, int>> stack{{index, depth}};
    while (!stack.empty()) {
        auto [i, d] = stack.back();
        stack.pop_back();
        auto& n = nodes_[static_cast<size_t>(i)];
        n.depth = d;
        max_depth_ = std::max(max_depth_, d);
        for (int child : n.children) stack.emplace_back(child, d + 1);
    }
}

int ContourTree::insert(Contour contour) {
    const int input_index = inserted_++;
    if (contour.points.size() < 3) {
        diagnostics_.push_back(too_few_points(input_index, contour));
        return -1;
    }
    contour.bbox = geometry::bounding_box(contour.points);

    const int index = static_cast<int>(contours_.size());
    contours_.push_back(std::move(contour));
    nodes_.push_back({index, -1, {}, 0});

    // Descend while an existing child encloses the new contour.
    int cursor = -1;
    for (bool descended = true; descended;) {
        descended = false;
        for (int child : children_of(cursor)) {
            if (encloses(child, index)) {
                cursor = child;
                descended = true;
                break;
            }
        }
    }

    // Siblings enclosed by the new contour were placed too shallow earlier.
    auto& siblings = children_of(cursor);
    auto& adopted = nodes_[static_cast<size_t>(index)].children;
    auto keep = std::stable_partition(siblings.begin(), siblings.end(),
                                      [&](int s) { return !encloses(index, s); });
    for (auto it = keep; it != siblings.end(); ++it) {
        adopted.push_back(*it);
        nodes_[static_cast<size_t>(*it)].parent_index = index;
    }
    siblings.erase(keep, siblings.end());

    siblings.push_back(index);
    nodes_[static_cast<size_t>(index)].parent_index = cursor;

    const int depth = cursor < 0 ? 0 : nodes_[static_cast<size_t>(cursor)].depth + 1;
    assign_depths(index, depth);
    return index;
}

std::vector<int> ContourTree::coastlines() const {
    std::vector<int> result;
    for (size_t i = 0; i < contours_.size(); i++) {
        if (std::abs(contours_[i].height) < coastline_tolerance) result.push_back(static_cast<int>(i));
    }
    return result;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

std::vector<Diagnostic> validate(const std::vector<Contour>& contours) {
    std::vector<Diagnostic> result;
    const int n = static_cast<int>(contours.size());

    for (int i = 0; i < n; i++) {
        const Contour& c = contours[static_cast<size_t>(i)];
        if (c.points.size() < 3) {
            result.push_back(too_few_points(i, c));
            continue;
        }
        auto hits = geometry::self_intersections(c.points);
        if (hits.empty()) continue;

        Diagnostic d;
        d.kind = DiagnosticKind::SelfIntersection;
        d.contour_a = i;
        d.count = static_cast<int>(hits.size());
        d.point = hits[0].point;
        d.message = std::format(
            "contour {} at height {} self-intersects: {} intersection(s), first at ({:.0f}, {:.0f}) "
            "between segments {} and {}",
            i, c.height, hits.size(), hits[0].point[0], hits[0].point[1],
            hits[0].segment_a, hits[0].segment_b);
        result.push_back(std::move(d));
    }

    for (int i = 0; i < n; i++) {
        const Contour& a = contours[static_cast<size_t>(i)];
        if (a.points.size() < 3) continue;
        for (int j = i + 1; j < n; j++) {
            const Contour& b = contours[static_cast<size_t>(j)];
            if (b.points.size() < 3) continue;

            auto hits = geometry::polygon_intersections(a.points, b.points);
            if (hits.empty()) continue;

            Diagnostic d;
            d.kind = DiagnosticKind::ContourIntersection;
            d.contour_a = i;
            d.contour_b = j;
            d.count = static_cast<int>(hits.size());
            d.point = hits[0].point;
            d.message = std::format(
                "contours {} (height {}) and {} (height {}) intersect: {} intersection(s), "
                "first at ({:.0f}, {:.0f})",
                i, a.height, j, b.height, hits.size(), hits[0].point[0], hits[0].point[1]);
            result.push_back(std::move(d));
        }
    }
    return result;
}

} // namespace contourfield::contourtree
