#include "contourfield/contourtree.h"
#include "contourfield/flatfield.h"
#include "contourfield/heightquery.h"
#include "contourfield/terrainfile.h"
#include "../common/cli_logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <format>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace ct = contourfield::contourtree;
namespace ff = contourfield::flatfield;
namespace hq = contourfield::heightquery;
namespace tf = contourfield::terrainfile;

using json = nlohmann::ordered_json;

static void print_usage() {
    contourfield::cli::print("Usage: field_query [flags] <terrain.json>");
    contourfield::cli::print("");
    contourfield::cli::print("Builds the contour field of a terrain file and samples heights.");
    contourfield::cli::print("");
    contourfield::cli::print("Flags:");
    contourfield::cli::print("  --at <x> <y>      Sample the height at a world point (repeatable)");
    contourfield::cli::print("  --validate        Check contours for self and pairwise intersections");
    contourfield::cli::print("  --ccw             Normalise contour winding to counter-clockwise on load");
    contourfield::cli::print("  --json            Write the report as JSON to stdout");
    contourfield::cli::print("  -v, --verbose     Verbose logging");
    contourfield::cli::print("  -vv, --debug      Debug logging");
}

static std::string describe(const ct::Diagnostic& d, const std::vector<ct::Contour>& contours) {
    auto name_of = [&](int i) {
        if (i < 0 || static_cast<size_t>(i) >= contours.size()) return std::format("#{}", i);
        const auto& name = contours[static_cast<size_t>(i)].name;
        return name.empty() ? std::format("#{}", i) : std::format("'{}'", name);
    };
    std::string s = std::format("{} {}", ct::diagnostic_kind_name(d.kind), name_of(d.contour_a));
    if (d.contour_b >= 0) s += " x " + name_of(d.contour_b);
    if (!d.message.empty()) s += ": " + d.message;
    return s;
}

static json diagnostic_json(const ct::Diagnostic& d) {
    return {
        {"kind", ct::diagnostic_kind_name(d.kind)},
        {"contourA", d.contour_a},
        {"contourB", d.contour_b},
        {"count", d.count},
        {"point", {d.point[0], d.point[1]}},
        {"message", d.message},
    };
}

int main(int argc, char* argv[]) {
    std::vector<contourfield::geometry::Point> samples;
    bool validate = false;
    bool json_out = false;
    tf::LoadOptions load_options;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--at") == 0) {
            if (i + 2 >= argc) {
                LOGE("--at expects two coordinates");
                return 1;
            }
            try {
                const double x = std::stod(argv[i + 1]);
                const double y = std::stod(argv[i + 2]);
                samples.push_back({x, y});
            } catch (const std::exception&) {
                LOGE("invalid --at coordinates", argv[i + 1], argv[i + 2]);
                return 1;
            }
            i += 2;
        } else if (std::strcmp(argv[i], "--validate") == 0) {
            validate = true;
        } else if (std::strcmp(argv[i], "--ccw") == 0) {
            load_options.normalize_winding = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            json_out = true;
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

    contourfield::cli::set_verbosity(verbosity);

    if (positional.size() != 1) {
        print_usage();
        return 1;
    }
    const std::string& input_path = positional[0];

    tf::TerrainDefinition def;
    try {
        def = tf::load(input_path, load_options);
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }
    LOGI("loaded", def.contours.size(), "contours from", input_path);

    std::vector<ct::Diagnostic> problems;
    if (validate) {
        problems = ct::validate(def.contours);
        for (const auto& d : problems) LOGW(describe(d, def.contours));
        LOGI("validation found", problems.size(), "problems");
    }

    ct::ContourTree tree;
    for (size_t i = 0; i < def.contours.size(); i++) {
        const int index = tree.insert(def.contours[i]);
        if (index < 0) LOGW(std::format("contour {} dropped: fewer than 3 points", i));
        else LOGD("inserted", i, "depth", tree.node(index).depth);
    }

    const ff::FlattenedField field = ff::compile(tree, def.default_depth);
    if (!ff::skip_counts_consistent(field)) {
        LOGE("compiled field has inconsistent skip counts");
        return 1;
    }

    if (json_out) {
        json report;
        report["file"] = input_path;
        report["contours"] = field.size();
        report["roots"] = tree.roots().size();
        report["maxDepth"] = field.max_depth;
        report["coastlines"] = field.coastlines.size();
        report["defaultHeight"] = field.default_height;

        json diags = json::array();
        for (const auto& d : tree.diagnostics()) diags.push_back(diagnostic_json(d));
        for (const auto& d : problems) diags.push_back(diagnostic_json(d));
        report["diagnostics"] = diags;

        json heights = json::array();
        for (const auto& p : samples) {
            const int deepest = hq::find_deepest(field, p);
            json entry = {{"x", p[0]}, {"y", p[1]}, {"height", hq::compute_height_at(field, p)}};
            if (deepest >= 0) {
                const auto& c = tree.contour(field.entries[static_cast<size_t>(deepest)].contour_index);
                entry["contour"] = c.name;
            } else {
                entry["contour"] = nullptr;
            }
            heights.push_back(entry);
        }
        report["samples"] = heights;
        std::cout << std::setw(2) << report << '\n';
    } else {
        contourfield::cli::print(std::format("{}: {} contours, {} roots, max depth {}, {} coastlines",
                                             input_path, field.size(), tree.roots().size(),
                                             field.max_depth, field.coastlines.size()));
        for (const auto& p : samples) {
            const int deepest = hq::find_deepest(field, p);
            std::string inside = "outside";
            if (deepest >= 0)
                inside = tree.contour(field.entries[static_cast<size_t>(deepest)].contour_index).name;
            contourfield::cli::print(std::format("{:.3f} {:.3f} -> {:.4f} ({})", p[0], p[1],
                                                 hq::compute_height_at(field, p), inside));
        }
    }

    return (validate && !problems.empty()) ? 2 : 0;
}
