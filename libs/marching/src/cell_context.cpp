#include "terratools/marching.h"

#include <algorithm>
#include <cmath>

namespace terratools::marching {

float merge_threshold(MergeMode mode) {
    switch (mode) {
        case MergeMode::Cubic: return 0.6f;
        case MergeMode::Polyhedron: return 1.3f;
        case MergeMode::RoundedPolyhedron: return 2.1f;
        case MergeMode::SemiRound: return 5.0f;
        case MergeMode::Spherical: return 20.0f;
    }
    return 1.3f;
}

MergeMode merge_mode_from_index(int idx) {
    switch (idx) {
        case 0: return MergeMode::Cubic;
        case 1: return MergeMode::Polyhedron;
        case 2: return MergeMode::RoundedPolyhedron;
        case 3: return MergeMode::SemiRound;
        case 4: return MergeMode::Spherical;
        default: return MergeMode::Polyhedron;
    }
}

int merge_mode_index(MergeMode mode) {
    return static_cast<int>(mode);
}

bool is_round(MergeMode mode) {
    return mode == MergeMode::SemiRound || mode == MergeMode::Spherical;
}

bool CellGeometry::consistent() const {
    const size_t n = positions.size();
    return uvs.size() == n && uv2s.size() == n && colors_0.size() == n && colors_1.size() == n &&
           grass_mask.size() == n && material_blend.size() == n && is_floor.size() == n && n % 3 == 0;
}

void CellGeometry::clear() {
    positions.clear();
    uvs.clear();
    uv2s.clear();
    colors_0.clear();
    colors_1.clear();
    grass_mask.clear();
    material_blend.clear();
    is_floor.clear();
    warnings.clear();
}

bool GridMaps::valid() const {
    if (width <= 0 || depth <= 0) return false;
    const size_t n = static_cast<size_t>(width) * static_cast<size_t>(depth);
    return heights.size() == n && color_0.size() == n && color_1.size() == n &&
           wall_color_0.size() == n && wall_color_1.size() == n && grass_mask.size() == n;
}

float BoundaryProfile::height_at(float t, bool upper) const {
    if (merged) return h1 + (h2 - h1) * t;
    return upper ? std::max(h1, h2) : std::min(h1, h2);
}

BoundaryProfile make_boundary_profile(float h1, float h2, float threshold) {
    return {h1, h2, std::abs(h1 - h2) < threshold};
}

void CellContext::rotate(int n) {
    rotation = (rotation + 4 + n % 4) % 4;
}

bool CellContext::is_merged(float a, float b) const {
    return std::abs(a - b) < merge_threshold;
}

// Profiles 2 (CD) and 3 (AC) run against the circular corner order, so t is
// flipped when one of them is read as a logical AB or BD edge, and the other
// way round for logical CD and AC.
float CellContext::ab_height(float t, bool upper) const {
    const int p = rotation % 4;
    return profiles[static_cast<size_t>(p)].height_at(p >= 2 ? 1.0f - t : t, upper);
}

float CellContext::bd_height(float t, bool upper) const {
    const int p = (rotation + 1) % 4;
    return profiles[static_cast<size_t>(p)].height_at(p >= 2 ? 1.0f - t : t, upper);
}

float CellContext::cd_height(float t, bool upper) const {
    const int p = (rotation + 2) % 4;
    return profiles[static_cast<size_t>(p)].height_at(p < 2 ? 1.0f - t : t, upper);
}

float CellContext::ac_height(float t, bool upper) const {
    const int p = (rotation + 3) % 4;
    return profiles[static_cast<size_t>(p)].height_at(p < 2 ? 1.0f - t : t, upper);
}

std::array<size_t, 4> CellContext::corner_indices(const GridMaps& maps) const {
    return {
        maps.index(cell_x, cell_z),         // A
        maps.index(cell_x + 1, cell_z),     // B
        maps.index(cell_x, cell_z + 1),     // C
        maps.index(cell_x + 1, cell_z + 1), // D
    };
}

CellContext make_cell_context(const std::array<float, 4>& heights, float merge_threshold) {
    CellContext ctx;
    ctx.heights = heights;
    ctx.merge_threshold = merge_threshold;

    const float a = heights[0];
    const float b = heights[1];
    const float d = heights[2];
    const float c = heights[3];

    ctx.edges = {ctx.is_merged(a, b), ctx.is_merged(b, d), ctx.is_merged(c, d), ctx.is_merged(a, c)};
    ctx.profiles = {
        make_boundary_profile(a, b, merge_threshold),
        make_boundary_profile(b, d, merge_threshold),
        make_boundary_profile(c, d, merge_threshold),
        make_boundary_profile(a, c, merge_threshold),
    };

    ctx.colors.min_height = std::min({a, b, c, d});
    ctx.colors.max_height = std::max({a, b, c, d});
    ctx.colors.is_boundary = !(ctx.edges[0] && ctx.edges[1] && ctx.edges[2] && ctx.edges[3]);
    return ctx;
}

CellContext make_cell_context(const GridMaps& maps, int cell_x, int cell_z, float merge_threshold) {
    if (!maps.valid() || !maps.contains(cell_x, cell_z) || !maps.contains(cell_x + 1, cell_z + 1)) {
        CellContext ctx = make_cell_context(std::array<float, 4>{}, merge_threshold);
        ctx.cell_x = cell_x;
        ctx.cell_z = cell_z;
        return ctx;
    }

    const std::array<float, 4> heights = {
        maps.heights[maps.index(cell_x, cell_z)],
        maps.heights[maps.index(cell_x + 1, cell_z)],
        maps.heights[maps.index(cell_x + 1, cell_z + 1)],
        maps.heights[maps.index(cell_x, cell_z + 1)],
    };
    CellContext ctx = make_cell_context(heights, merge_threshold);
    ctx.cell_x = cell_x;
    ctx.cell_z = cell_z;
    compute_boundary_colors(ctx, maps);
    compute_material_pair(ctx, maps);
    return ctx;
}

void compute_boundary_colors(CellContext& ctx, const GridMaps& maps) {
    const auto corners = ctx.corner_indices(maps);
    // scan order A, B, C, D
    const std::array<float, 4> corner_heights = {ctx.heights[0], ctx.heights[1], ctx.heights[3], ctx.heights[2]};

    size_t min_idx = 0;
    size_t max_idx = 0;
    for (size_t i = 1; i < 4; ++i) {
        if (corner_heights[i] < corner_heights[min_idx]) min_idx = i;
        if (corner_heights[i] > corner_heights[max_idx]) max_idx = i;
    }

    auto& s = ctx.colors;
    s.floor_lower_color_0 = maps.color_0[corners[min_idx]];
    s.floor_upper_color_0 = maps.color_0[corners[max_idx]];
    s.floor_lower_color_1 = maps.color_1[corners[min_idx]];
    s.floor_upper_color_1 = maps.color_1[corners[max_idx]];
    s.wall_lower_color_0 = maps.wall_color_0[corners[min_idx]];
    s.wall_upper_color_0 = maps.wall_color_0[corners[max_idx]];
    s.wall_lower_color_1 = maps.wall_color_1[corners[min_idx]];
    s.wall_upper_color_1 = maps.wall_color_1[corners[max_idx]];
}

void compute_material_pair(CellContext& ctx, const GridMaps& maps) {
    const auto corners = ctx.corner_indices(maps);

    std::array<uint8_t, texslot::slot_count> counts{};
    std::array<uint8_t, 4> order{};
    size_t distinct = 0;
    for (const size_t idx : corners) {
        const uint8_t tex = texslot::encode(maps.color_0[idx], maps.color_1[idx]);
        if (counts[tex]++ == 0) order[distinct++] = tex;
    }

    // first-seen order breaks ties
    std::stable_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(distinct),
                     [&counts](uint8_t l, uint8_t r) { return counts[l] > counts[r]; });

    auto& s = ctx.colors;
    s.material_a = order[0];
    s.material_b = distinct > 1 ? order[1] : s.material_a;
    s.material_c = distinct > 2 ? order[2] : s.material_b;
}

Color material_blend(const CellContext& ctx, const GridMaps& maps, bool wall_colors, float x, float z) {
    const auto corners = ctx.corner_indices(maps);
    const auto& map_0 = wall_colors ? maps.wall_color_0 : maps.color_0;
    const auto& map_1 = wall_colors ? maps.wall_color_1 : maps.color_1;

    const std::array<float, 4> weights = {
        (1.0f - x) * (1.0f - z),
        x * (1.0f - z),
        (1.0f - x) * z,
        x * z,
    };

    const auto& s = ctx.colors;
    float wa = 0.0f;
    float wb = 0.0f;
    float wc = 0.0f;
    for (size_t i = 0; i < 4; ++i) {
        const uint8_t tex = texslot::encode(map_0[corners[i]], map_1[corners[i]]);
        if (tex == s.material_a) wa += weights[i];
        else if (tex == s.material_b) wb += weights[i];
        else if (tex == s.material_c) wc += weights[i];
    }

    const float total = wa + wb + wc;
    if (total > min_weight_threshold) {
        wa /= total;
        wb /= total;
    }

    const float packed = (static_cast<float>(s.material_a) + static_cast<float>(s.material_b) * material_pack_scale) /
                         material_pack_normalize;
    return {packed, static_cast<float>(s.material_c) / material_index_scale, wa, wb};
}

} // namespace terratools::marching
