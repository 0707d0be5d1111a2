#include "terratools/marching.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace terratools::marching {

namespace {

[[nodiscard]] bool matches(CellCase kind, const CellContext& ctx) {
    const float a = ctx.ay();
    const float b = ctx.by();
    const float c = ctx.cy();
    const float d = ctx.dy();

    switch (kind) {
        case CellCase::FullFloor:
            return ctx.ab() && ctx.bd() && ctx.cd() && ctx.ac();
        case CellCase::SingleWall: {
            const int open = (ctx.ab() ? 0 : 1) + (ctx.bd() ? 0 : 1) + (ctx.cd() ? 0 : 1) + (ctx.ac() ? 0 : 1);
            if (open != 1) return false;
            return (!ctx.ab() && a > b) || (!ctx.ac() && a > c);
        }
        case CellCase::OuterCorner:
            return ctx.is_higher(a, b) && ctx.is_higher(a, c) && ctx.bd() && ctx.cd();
        case CellCase::Edge:
            return ctx.ab() && ctx.cd() && ctx.is_higher(a, c) && ctx.is_higher(b, d);
        case CellCase::EdgeOuterA:
            return ctx.is_higher(a, b) && ctx.is_higher(b, d) && ctx.is_higher(a, c) && ctx.cd();
        case CellCase::EdgeOuterB:
            return ctx.is_higher(b, a) && ctx.is_higher(a, c) && ctx.is_higher(b, d) && ctx.cd();
        case CellCase::InnerCorner:
            return ctx.is_lower(a, b) && ctx.is_lower(a, c) && ctx.bd() && ctx.cd();
        case CellCase::InnerCornerEdgeCD:
            return ctx.is_lower(a, b) && ctx.is_lower(a, c) && ctx.is_higher(d, b) && ctx.cd();
        case CellCase::InnerCornerEdgeBD:
            return ctx.is_lower(a, b) && ctx.is_lower(a, c) && ctx.is_higher(d, c) && ctx.bd();
        case CellCase::DoubleInner:
            return ctx.is_lower(a, b) && ctx.is_lower(a, c) && ctx.is_higher(b, d) && ctx.is_higher(c, d) &&
                   ctx.is_merged(b, c);
        case CellCase::DoubleOuter:
            return ctx.is_higher(a, b) && ctx.is_higher(a, c) && ctx.is_higher(d, b) && ctx.is_higher(d, c) &&
                   ctx.is_merged(b, c);
        case CellCase::InnerOuterDiagonal:
            return ctx.is_lower(a, b) && ctx.is_lower(a, c) && ctx.is_higher(d, b) && ctx.is_higher(d, c) &&
                   ctx.is_merged(b, c);
        case CellCase::DoubleInnerAsymmetric:
            return ctx.is_lower(a, b) && ctx.is_lower(a, c) && ctx.is_higher(b, d) && ctx.is_higher(c, d) &&
                   ctx.is_higher(b, c);
        case CellCase::Terrace:
            return true;
    }
    return false;
}

[[nodiscard]] std::array<float, 4> rotated_tuple(const CellContext& ctx) {
    return {ctx.ay(), ctx.by(), ctx.dy(), ctx.cy()};
}

constexpr std::array<CellCase, 14> priority_order = {
    CellCase::FullFloor,
    CellCase::SingleWall,
    CellCase::OuterCorner,
    CellCase::Edge,
    CellCase::EdgeOuterA,
    CellCase::EdgeOuterB,
    CellCase::InnerCorner,
    CellCase::InnerCornerEdgeCD,
    CellCase::InnerCornerEdgeBD,
    CellCase::DoubleInner,
    CellCase::DoubleOuter,
    CellCase::InnerOuterDiagonal,
    CellCase::DoubleInnerAsymmetric,
    CellCase::Terrace,
};

[[nodiscard]] CaseMatch classify(CellContext ctx) {
    for (const CellCase kind : priority_order) {
        if (kind == CellCase::FullFloor) {
            ctx.rotation = 0;
            if (matches(kind, ctx)) return {kind, 0};
            continue;
        }

        int best = -1;
        std::array<float, 4> best_tuple{};
        for (int r = 0; r < 4; ++r) {
            ctx.rotation = r;
            if (!matches(kind, ctx)) continue;
            const auto tuple = rotated_tuple(ctx);
            if (best < 0 || tuple > best_tuple) {
                best = r;
                best_tuple = tuple;
            }
        }
        if (best >= 0) return {kind, best};
    }
    return {CellCase::Terrace, 0};
}

void emit_terrace(CellBuilder& b) {
    auto& ctx = b.context();
    std::array<float, 4> sorted = ctx.heights;
    std::sort(sorted.begin(), sorted.end());
    const float level = (sorted[1] + sorted[2]) / 2.0f;

    for (int i = 0; i < 4; ++i) {
        if (ctx.ay() >= level) {
            OuterCornerOptions outer;
            outer.floor_below = false;
            outer.flatten = true;
            outer.bottom_height = level;
            add_outer_corner(b, outer);
        } else {
            InnerCornerOptions inner;
            inner.full_upper_floor = false;
            inner.flatten = true;
            inner.top_height = level;
            add_inner_corner(b, inner);
        }
        ctx.rotate(1);
    }
    add_center_floor(b, level);
}

// emit_plateau_skirt fills the level floor fanned from corner C to the four
// edge midpoints. The AB and BD midpoints sit on the base of a plateau at B.
void emit_plateau_skirt(CellBuilder& b, float level) {
    b.start_floor();
    b.add_point(0.0f, level, 1.0f);
    b.add_point(0.0f, level, 0.5f, 0.0f, 1.0f);
    b.add_point(0.5f, level, 0.0f, 1.0f, 0.0f);

    b.add_point(0.0f, level, 1.0f);
    b.add_point(0.5f, level, 0.0f, 1.0f, 0.0f);
    b.add_point(1.0f, level, 0.5f, 1.0f, 0.0f);

    b.add_point(0.0f, level, 1.0f);
    b.add_point(1.0f, level, 0.5f, 1.0f, 0.0f);
    b.add_point(0.5f, level, 1.0f, 0.0f, 1.0f);
}

void emit_case(CellBuilder& b, CellCase kind) {
    auto& ctx = b.context();

    switch (kind) {
        case CellCase::FullFloor:
            add_full_floor(b);
            break;

        case CellCase::SingleWall:
        case CellCase::OuterCorner:
            add_outer_corner(b);
            break;

        case CellCase::Edge:
            add_edge(b);
            break;

        case CellCase::EdgeOuterA: {
            const float bottom = ctx.by();
            EdgeOptions edge;
            edge.a_x = 0.5f;
            add_edge(b, edge);

            OuterCornerOptions outer;
            outer.floor_below = false;
            outer.flatten = true;
            outer.bottom_height = bottom;
            add_outer_corner(b, outer);
            break;
        }

        case CellCase::EdgeOuterB: {
            const float bottom = ctx.ay();
            EdgeOptions edge;
            edge.b_x = 0.5f;
            add_edge(b, edge);

            ctx.rotate(1);
            OuterCornerOptions outer;
            outer.floor_below = false;
            outer.flatten = true;
            outer.bottom_height = bottom;
            add_outer_corner(b, outer);
            break;
        }

        case CellCase::InnerCorner:
            add_inner_corner(b);
            break;

        case CellCase::InnerCornerEdgeCD: {
            InnerCornerOptions inner;
            inner.full_upper_floor = false;
            inner.flatten = true;
            inner.cd_floor = true;
            add_inner_corner(b, inner);

            ctx.rotate(2);
            EdgeOptions edge;
            edge.floor_below = false;
            add_edge(b, edge);
            break;
        }

        case CellCase::InnerCornerEdgeBD: {
            InnerCornerOptions inner;
            inner.full_upper_floor = false;
            inner.flatten = true;
            inner.bd_floor = true;
            add_inner_corner(b, inner);

            ctx.rotate(1);
            EdgeOptions edge;
            edge.floor_below = false;
            add_edge(b, edge);
            break;
        }

        case CellCase::DoubleInner: {
            InnerCornerOptions inner;
            inner.full_upper_floor = false;
            add_inner_corner(b, inner);
            add_diagonal_floor(b, {ctx.by(), ctx.cy(), true, true});
            ctx.rotate(2);
            add_inner_corner(b, inner);
            break;
        }

        case CellCase::DoubleOuter: {
            OuterCornerOptions outer;
            outer.floor_below = false;
            add_outer_corner(b, outer);
            add_diagonal_floor(b, {ctx.by(), ctx.cy(), false, false});
            ctx.rotate(2);
            add_outer_corner(b, outer);
            break;
        }

        case CellCase::InnerOuterDiagonal: {
            InnerCornerOptions inner;
            inner.full_upper_floor = false;
            add_inner_corner(b, inner);
            add_diagonal_floor(b, {ctx.by(), ctx.cy(), true, false});
            ctx.rotate(2);
            OuterCornerOptions outer;
            outer.floor_below = false;
            add_outer_corner(b, outer);
            break;
        }

        case CellCase::DoubleInnerAsymmetric: {
            const float level = ctx.cy();

            // plateau at B, both inner corners flattened to C, then the floor
            // between the three walls
            ctx.rotate(1);
            OuterCornerOptions outer;
            outer.floor_below = false;
            outer.flatten = true;
            outer.bottom_height = level;
            add_outer_corner(b, outer);
            ctx.rotate(-1);

            InnerCornerOptions inner;
            inner.full_upper_floor = false;
            inner.flatten = true;
            inner.top_height = level;
            add_inner_corner(b, inner);
            emit_plateau_skirt(b, level);
            ctx.rotate(2);
            add_inner_corner(b, inner);
            break;
        }

        case CellCase::Terrace:
            emit_terrace(b);
            break;
    }
}

} // namespace

const char* case_name(CellCase c) {
    switch (c) {
        case CellCase::FullFloor: return "full_floor";
        case CellCase::SingleWall: return "single_wall";
        case CellCase::OuterCorner: return "outer_corner";
        case CellCase::Edge: return "edge";
        case CellCase::EdgeOuterA: return "edge_outer_a";
        case CellCase::EdgeOuterB: return "edge_outer_b";
        case CellCase::InnerCorner: return "inner_corner";
        case CellCase::InnerCornerEdgeCD: return "inner_corner_edge_cd";
        case CellCase::InnerCornerEdgeBD: return "inner_corner_edge_bd";
        case CellCase::DoubleInner: return "double_inner";
        case CellCase::DoubleOuter: return "double_outer";
        case CellCase::InnerOuterDiagonal: return "inner_outer_diagonal";
        case CellCase::DoubleInnerAsymmetric: return "double_inner_asymmetric";
        case CellCase::Terrace: return "terrace";
    }
    return "unknown";
}

CaseMatch classify_cell(const std::array<float, 4>& heights, float merge_threshold) {
    return classify(make_cell_context(heights, merge_threshold));
}

CaseMatch generate_cell(const GridMaps& maps, const CellConfig& config, int cell_x, int cell_z,
                        CellGeometry& out) {
    const CellContext ctx = make_cell_context(maps, cell_x, cell_z, config.merge_threshold);
    return generate_cell(maps, config, ctx, out);
}

CaseMatch generate_cell(const GridMaps& maps, const CellConfig& config, const CellContext& ctx,
                        CellGeometry& out) {
    CellContext work = ctx;
    work.rotation = 0;
    const CaseMatch match = classify(work);

    work.rotation = match.rotation;
    CellBuilder builder(maps, config, std::move(work), out);
    emit_case(builder, match.kind);
    return match;
}

} // namespace terratools::marching
