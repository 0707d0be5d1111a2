#include "terratools/marching.h"

#include <algorithm>

namespace terratools::marching {

void add_full_floor(CellBuilder& b) {
    const auto& ctx = b.context();
    const float ay = ctx.ay();
    const float by = ctx.by();
    const float cy = ctx.cy();
    const float dy = ctx.dy();

    b.start_floor();
    if (!b.config().higher_poly_floors) {
        b.add_point(0.0f, ay, 0.0f);
        b.add_point(1.0f, by, 0.0f);
        b.add_point(0.0f, cy, 1.0f);

        b.add_point(1.0f, by, 0.0f);
        b.add_point(1.0f, dy, 1.0f);
        b.add_point(0.0f, cy, 1.0f);
        return;
    }

    // four triangles fanned around the averaged centre
    const float ey = (ay + by + cy + dy) / 4.0f;

    b.add_point(0.0f, ay, 0.0f);
    b.add_point(1.0f, by, 0.0f);
    b.add_point(0.5f, ey, 0.5f, 0.0f, 0.0f, true);

    b.add_point(1.0f, by, 0.0f);
    b.add_point(1.0f, dy, 1.0f);
    b.add_point(0.5f, ey, 0.5f, 0.0f, 0.0f, true);

    b.add_point(1.0f, dy, 1.0f);
    b.add_point(0.0f, cy, 1.0f);
    b.add_point(0.5f, ey, 0.5f, 0.0f, 0.0f, true);

    b.add_point(0.0f, cy, 1.0f);
    b.add_point(0.0f, ay, 0.0f);
    b.add_point(0.5f, ey, 0.5f, 0.0f, 0.0f, true);
}

void add_outer_corner(CellBuilder& b, const OuterCornerOptions& opt) {
    const auto& ctx = b.context();
    const float ay = ctx.ay();
    const float by = ctx.by();
    const float cy = ctx.cy();
    const float dy = ctx.dy();

    const float top_ab = ctx.ab_height(0.5f, true);
    const float top_ac = ctx.ac_height(0.5f, true);

    float base_ab = ctx.ab_height(0.5f, false);
    float base_ac = ctx.ac_height(0.5f, false);
    if (opt.flatten) {
        base_ab = opt.bottom_height.value_or(std::min(by, cy));
        base_ac = base_ab;
    }

    if (opt.floor_above) {
        b.start_floor();
        b.add_point(0.0f, ay, 0.0f, 0.0f, 0.0f);
        b.add_point(0.5f, top_ab, 0.0f, 0.0f, 1.0f);
        b.add_point(0.0f, top_ac, 0.5f, 0.0f, 1.0f);
    }

    b.start_wall();
    b.add_point(0.0f, base_ac, 0.5f, 0.0f, 0.0f);
    b.add_point(0.0f, top_ac, 0.5f, 0.0f, 1.0f);
    b.add_point(0.5f, base_ab, 0.0f, 1.0f, 0.0f);

    b.add_point(0.5f, top_ab, 0.0f, 1.0f, 1.0f);
    b.add_point(0.5f, base_ab, 0.0f, 1.0f, 0.0f);
    b.add_point(0.0f, top_ac, 0.5f, 0.0f, 1.0f);

    if (opt.floor_below) {
        b.start_floor();
        b.add_point(1.0f, dy, 1.0f);
        b.add_point(0.0f, cy, 1.0f);
        b.add_point(1.0f, by, 0.0f);

        b.add_point(0.0f, cy, 1.0f);
        b.add_point(0.0f, base_ac, 0.5f, 1.0f, 0.0f);
        b.add_point(0.5f, base_ab, 0.0f, 1.0f, 0.0f);

        b.add_point(1.0f, by, 0.0f);
        b.add_point(0.0f, cy, 1.0f);
        b.add_point(0.5f, base_ab, 0.0f, 1.0f, 0.0f);
    }
}

void add_edge(CellBuilder& b, const EdgeOptions& opt) {
    const auto& ctx = b.context();
    const float ay = ctx.ay();
    const float by = ctx.by();
    const float cy = ctx.cy();
    const float dy = ctx.dy();

    const float top_left = ctx.ab() ? ctx.ac_height(0.5f, true) : std::min(ay, by);
    const float top_right = ctx.ab() ? ctx.bd_height(0.5f, true) : std::min(ay, by);
    const float bot_left = ctx.cd() ? ctx.ac_height(0.5f, false) : std::max(cy, dy);
    const float bot_right = ctx.cd() ? ctx.bd_height(0.5f, false) : std::max(cy, dy);

    if (opt.floor_above) {
        const float va = ctx.ab_height(opt.a_x, false);
        const float vb = ctx.ab_height(opt.b_x, false);

        b.start_floor();
        b.add_point(opt.a_x, va, 0.0f, 0.0f, 0.0f);
        b.add_point(opt.b_x, vb, 0.0f, 0.0f, 0.0f);
        b.add_point(0.0f, top_left, 0.5f, 0.0f, 1.0f);

        b.add_point(1.0f, top_right, 0.5f, 0.0f, 1.0f);
        b.add_point(0.0f, top_left, 0.5f, 0.0f, 1.0f);
        b.add_point(opt.b_x, vb, 0.0f, 0.0f, 0.0f);
    }

    b.start_wall();
    b.add_point(0.0f, bot_left, 0.5f, 0.0f, 0.0f);
    b.add_point(0.0f, top_left, 0.5f, 0.0f, 1.0f);
    b.add_point(1.0f, bot_right, 0.5f, 1.0f, 0.0f);

    b.add_point(1.0f, top_right, 0.5f, 1.0f, 1.0f);
    b.add_point(1.0f, bot_right, 0.5f, 1.0f, 0.0f);
    b.add_point(0.0f, top_left, 0.5f, 0.0f, 1.0f);

    if (opt.floor_below) {
        b.start_floor();
        b.add_point(0.0f, bot_left, 0.5f, 1.0f, 0.0f);
        b.add_point(1.0f, bot_right, 0.5f, 1.0f, 0.0f);
        b.add_point(0.0f, cy, 1.0f);

        b.add_point(1.0f, dy, 1.0f);
        b.add_point(0.0f, cy, 1.0f);
        b.add_point(1.0f, bot_right, 0.5f, 1.0f, 0.0f);
    }
}

void add_inner_corner(CellBuilder& b, const InnerCornerOptions& opt) {
    const auto& ctx = b.context();
    const float ay = ctx.ay();
    const float by = ctx.by();
    const float cy = ctx.cy();
    const float dy = ctx.dy();

    const float top = opt.top_height.value_or(std::min(by, cy));
    const float corner_b = opt.flatten ? top : ctx.ab_height(0.5f, true);
    const float corner_c = opt.flatten ? top : ctx.ac_height(0.5f, true);
    const float low_ab = ctx.ab_height(0.5f, false);
    const float low_ac = ctx.ac_height(0.5f, false);

    b.start_floor();
    b.add_point(0.0f, ay, 0.0f);
    b.add_point(0.5f, low_ab, 0.0f, 1.0f, 0.0f);
    b.add_point(0.0f, low_ac, 0.5f, 1.0f, 0.0f);

    b.start_wall();
    b.add_point(0.0f, low_ac, 0.5f, 1.0f, 0.0f);
    b.add_point(0.5f, low_ab, 0.0f, 0.0f, 0.0f);
    b.add_point(0.0f, corner_c, 0.5f, 1.0f, 1.0f);

    b.add_point(0.5f, corner_b, 0.0f, 0.0f, 1.0f);
    b.add_point(0.0f, corner_c, 0.5f, 1.0f, 1.0f);
    b.add_point(0.5f, low_ab, 0.0f, 0.0f, 0.0f);

    if (opt.full_upper_floor) {
        b.start_floor();
        b.add_point(1.0f, dy, 1.0f);
        b.add_point(0.0f, cy, 1.0f);
        b.add_point(1.0f, by, 0.0f);

        b.add_point(0.0f, cy, 1.0f);
        b.add_point(0.0f, corner_c, 0.5f, 0.0f, 1.0f);
        b.add_point(0.5f, corner_b, 0.0f, 0.0f, 1.0f);

        b.add_point(1.0f, by, 0.0f);
        b.add_point(0.0f, cy, 1.0f);
        b.add_point(0.5f, corner_b, 0.0f, 0.0f, 1.0f);
    }

    if (opt.cd_floor) {
        b.start_floor();
        b.add_point(1.0f, by, 0.0f);
        b.add_point(0.0f, corner_b, 0.5f, 0.0f, 1.0f);
        b.add_point(0.5f, corner_b, 0.0f, 0.0f, 1.0f);

        b.add_point(1.0f, by, 0.0f);
        b.add_point(1.0f, by, 0.5f);
        b.add_point(0.0f, corner_b, 0.5f, 0.0f, 1.0f);
    }

    if (opt.bd_floor) {
        b.start_floor();
        b.add_point(0.0f, corner_c, 0.5f, 0.0f, 1.0f);
        b.add_point(0.5f, corner_c, 0.0f, 0.0f, 1.0f);
        b.add_point(0.0f, cy, 1.0f);

        b.add_point(0.5f, cy, 1.0f);
        b.add_point(0.0f, cy, 1.0f);
        b.add_point(0.5f, corner_c, 0.0f, 0.0f, 1.0f);
    }
}

void add_diagonal_floor(CellBuilder& b, const DiagonalFloorOptions& opt) {
    // cliff ends fade towards the top of the cliff, open ends towards the bottom
    const Vec2 a_uv = opt.a_cliff ? Vec2{0.0f, 1.0f} : Vec2{1.0f, 0.0f};
    const Vec2 d_uv = opt.d_cliff ? Vec2{0.0f, 1.0f} : Vec2{1.0f, 0.0f};

    b.start_floor();
    b.add_point(1.0f, opt.b_y, 0.0f);
    b.add_point(0.0f, opt.c_y, 1.0f);
    b.add_point(0.5f, opt.b_y, 0.0f, a_uv.x, a_uv.y);

    b.add_point(0.0f, opt.c_y, 1.0f);
    b.add_point(0.0f, opt.c_y, 0.5f, a_uv.x, a_uv.y);
    b.add_point(0.5f, opt.b_y, 0.0f, a_uv.x, a_uv.y);

    b.add_point(1.0f, opt.b_y, 0.0f);
    b.add_point(1.0f, opt.b_y, 0.5f, d_uv.x, d_uv.y);
    b.add_point(0.0f, opt.c_y, 1.0f);

    b.add_point(0.0f, opt.c_y, 1.0f);
    b.add_point(1.0f, opt.b_y, 0.5f, d_uv.x, d_uv.y);
    b.add_point(0.5f, opt.c_y, 1.0f, d_uv.x, d_uv.y);
}

void add_center_floor(CellBuilder& b, float height) {
    b.start_floor();
    b.add_point(0.5f, height, 0.0f);
    b.add_point(1.0f, height, 0.5f);
    b.add_point(0.0f, height, 0.5f);

    b.add_point(1.0f, height, 0.5f);
    b.add_point(0.5f, height, 1.0f);
    b.add_point(0.0f, height, 0.5f);
}

} // namespace terratools::marching
