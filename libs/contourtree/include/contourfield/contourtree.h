#pragma once

#include <contourfield/geometry.h>

#include <cstddef>
#include <string>
#include <vector>

namespace contourfield::contourtree {

// Heights within this distance of zero count as coastline.
constexpr double coastline_tolerance = 0.01;

// Contour is a closed, already sampled loop at a fixed height.
struct Contour {
    std::string name;
    std::vector<geometry::Point> points;
    double height = 0;
    geometry::BBox bbox;
};

Contour make_contour(std::vector<geometry::Point> points, double height, std::string name = {});

enum class DiagnosticKind { TooFewPoints, SelfIntersection, ContourIntersection };

// Diagnostic describes questionable input. contour_a/contour_b index the
// caller's input sequence; contour_b is -1 unless two contours are involved.
struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::TooFewPoints;
    int contour_a = -1;
    int contour_b = -1;
    int count = 0;
    geometry::Point point{};
    std::string message;
};

struct ContourNode {
    int contour_index = -1;
    int parent_index = -1;
    std::vector<int> children;
    int depth = 0;
};

// ContourTree organises contours by geometric containment. A node's parent is
// the tightest contour enclosing it, independent of insertion order.
class ContourTree {
public:
    ContourTree() = default;
    explicit ContourTree(const std::vector<Contour>& contours);

    // Insert places contour under the tightest enclosing node and adopts any
    // nodes it encloses. Returns the new index, or -1 when the contour has
    // fewer than 3 points (recorded in diagnostics()).
    int insert(Contour contour);

    [[nodiscard]] size_t size() const { return contours_.size(); }
    [[nodiscard]] bool empty() const { return contours_.empty(); }
    [[nodiscard]] const std::vector<Contour>& contours() const { return contours_; }
    [[nodiscard]] const Contour& contour(int index) const;
    [[nodiscard]] const std::vector<ContourNode>& nodes() const { return nodes_; }
    [[nodiscard]] const ContourNode& node(int index) const;
    [[nodiscard]] const std::vector<int>& roots() const { return roots_; }
    [[nodiscard]] int max_depth() const { return max_depth_; }
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    // Coastlines lists contours whose height is approximately zero.
    [[nodiscard]] std::vector<int> coastlines() const;

private:
    [[nodiscard]] bool encloses(int outer, int inner) const;
    std::vector<int>& children_of(int parent);
    void assign_depths(int index, int depth);

    std::vector<Contour> contours_;
    std::vector<ContourNode> nodes_;
    std::vector<int> roots_;
    std::vector<Diagnostic> diagnostics_;
    int max_depth_ = 0;
    int inserted_ = 0;
};

// Validate reports self-intersecting contours, crossing pairs and contours
// with too few points. It never modifies or rejects the input.
std::vector<Diagnostic> validate(const std::vector<Contour>& contours);

const char* diagnostic_kind_name(DiagnosticKind kind);

} // namespace contourfield::contourtree
