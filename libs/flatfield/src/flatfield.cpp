#include <contourfield/flatfield.h>

#include <bit>
#include <cmath>

namespace contourfield::flatfield {

FlattenedField compile(const contourtree::ContourTree& tree, double default_height) {
    FlattenedField field;
    field.default_height = default_height;
    field.max_depth = tree.max_depth();

    const size_t n = tree.size();
    field.entries.reserve(n);

    std::vector<int> dfs_order;
    std::vector<int> to_dfs(n, -1);
    dfs_order.reserve(n);

    // Iterative pre-order walk. A frame is (node, next child); the skip count
    // is known once all children are exhausted.
    struct Frame { int node; size_t next; };
    for (int root : tree.roots()) {
        std::vector<Frame> stack{{root, 0}};
        to_dfs[static_cast<size_t>(root)] = static_cast<int>(dfs_order.size());
        dfs_order.push_back(root);
        field.entries.emplace_back();

        while (!stack.empty()) {
            Frame& f = stack.back();
            const auto& node = tree.node(f.node);
            if (f.next < node.children.size()) {
                const int child = node.children[f.next++];
                to_dfs[static_cast<size_t>(child)] = static_cast<int>(dfs_order.size());
                dfs_order.push_back(child);
                field.entries.emplace_back();
                stack.push_back({child, 0});
            } else {
                const int dfs = to_dfs[static_cast<size_t>(f.node)];
                field.entries[static_cast<size_t>(dfs)].skip_count =
                    static_cast<uint32_t>(dfs_order.size() - static_cast<size_t>(dfs) - 1);
                stack.pop_back();
            }
        }
    }

    for (size_t dfs = 0; dfs < dfs_order.size(); dfs++) {
        const int original = dfs_order[dfs];
        const auto& node = tree.node(original);
        const auto& contour = tree.contour(original);
        Entry& e = field.entries[dfs];

        e.contour_index = original;
        e.height = contour.height;
        e.parent_index = node.parent_index < 0 ? -1 : to_dfs[static_cast<size_t>(node.parent_index)];
        e.depth = node.depth;
        e.bbox = contour.bbox;
        e.is_coastline = std::abs(contour.height) < contourtree::coastline_tolerance;

        e.child_start = static_cast<uint32_t>(field.children.size());
        e.child_count = static_cast<uint32_t>(node.children.size());
        for (int child : node.children)
            field.children.push_back(static_cast<uint32_t>(to_dfs[static_cast<size_t>(child)]));

        e.point_start = static_cast<uint32_t>(field.points.size());
        e.point_count = static_cast<uint32_t>(contour.points.size());
        field.points.insert(field.points.end(), contour.points.begin(), contour.points.end());

        if (e.is_coastline) field.coastlines.push_back(static_cast<uint32_t>(dfs));
    }
    return field;
}

PackedField pack(const FlattenedField& field) {
    PackedField out;
    out.contour_count = static_cast<uint32_t>(field.entries.size());
    out.max_depth = static_cast<uint32_t>(field.max_depth);
    out.default_height = static_cast<float>(field.default_height);
    out.children = field.children;
    out.coastlines = field.coastlines;

    auto f32 = [](double v) { return std::bit_cast<uint32_t>(static_cast<float>(v)); };

    out.contours.reserve(field.entries.size() * words_per_contour);
    for (const auto& e : field.entries) {
        out.contours.push_back(e.point_start);
        out.contours.push_back(e.point_count);
        out.contours.push_back(f32(e.height));
        out.contours.push_back(std::bit_cast<uint32_t>(static_cast<int32_t>(e.parent_index)));
        out.contours.push_back(static_cast<uint32_t>(e.depth));
        out.contours.push_back(e.child_start);
        out.contours.push_back(e.child_count);
        out.contours.push_back(e.is_coastline ? 1u : 0u);
        out.contours.push_back(f32(e.bbox.min_x));
        out.contours.push_back(f32(e.bbox.min_y));
        out.contours.push_back(f32(e.bbox.max_x));
        out.contours.push_back(f32(e.bbox.max_y));
        out.contours.push_back(e.skip_count);
    }

    out.vertices.reserve(field.points.size() * 2);
    for (const auto& p : field.points) {
        out.vertices.push_back(static_cast<float>(p[0]));
        out.vertices.push_back(static_cast<float>(p[1]));
    }
    return out;
}

bool is_descendant(const FlattenedField& field, int candidate, int ancestor) {
    int cur = field.entries[static_cast<size_t>(candidate)].parent_index;
    while (cur >= 0) {
        if (cur == ancestor) return true;
        cur = field.entries[static_cast<size_t>(cur)].parent_index;
    }
    return false;
}

bool skip_counts_consistent(const FlattenedField& field) {
    const int n = static_cast<int>(field.entries.size());
    for (int i = 0; i < n; i++) {
        const int last = i + static_cast<int>(field.entries[static_cast<size_t>(i)].skip_count);
        if (last >= n) return false;
        for (int j = 0; j < n; j++) {
            const bool in_range = j > i && j <= last;
            if (in_range != is_descendant(field, j, i)) return false;
        }
    }
    return true;
}

} // namespace contourfield::flatfield
