#include "terratools/marching.h"

#include <algorithm>
#include <cmath>
#include <format>

namespace terratools::marching {

namespace {

[[nodiscard]] bool finite3(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

// preserve_high_channels re-asserts any channel that was fully set in either
// input so diagonal blends do not blur one-hot seams.
[[nodiscard]] Color preserve_high_channels(Color c, const Color& a, const Color& b) {
    if (a.r > dominant_channel_threshold || b.r > dominant_channel_threshold) c.r = 1.0f;
    if (a.g > dominant_channel_threshold || b.g > dominant_channel_threshold) c.g = 1.0f;
    if (a.b > dominant_channel_threshold || b.b > dominant_channel_threshold) c.b = 1.0f;
    if (a.a > dominant_channel_threshold || b.a > dominant_channel_threshold) c.a = 1.0f;
    return c;
}

} // namespace

CellBuilder::CellBuilder(const GridMaps& maps, const CellConfig& config, CellContext ctx, CellGeometry& out)
    : maps_(maps), config_(config), ctx_(std::move(ctx)), out_(out) {}

void CellBuilder::warn(const char* code, std::string message) {
    out_.warnings.push_back({code, std::move(message)});
}

bool CellBuilder::all_edges_blend_merged() const {
    const float t = ctx_.merge_threshold * blend_edge_sensitivity;
    const float a = ctx_.ay();
    const float b = ctx_.by();
    const float c = ctx_.cy();
    const float d = ctx_.dy();
    return std::abs(a - b) < t && std::abs(a - c) < t && std::abs(b - d) < t && std::abs(c - d) < t;
}

Color CellBuilder::vertex_color(const std::array<Color, 4>& corners, const Color& lower, const Color& upper,
                                float lower_t, float upper_t, float x, float y, float z,
                                bool diagonal_midpoint) const {
    if (config_.is_new_chunk) return texslot::default_texture_color;

    const bool direct = config_.blend_mode == BlendMode::Direct;

    if (diagonal_midpoint) {
        if (direct) return corners[0];
        const Color ad = texslot::lerp(corners[0], corners[3], 0.5f);
        const Color bc = texslot::lerp(corners[1], corners[2], 0.5f);
        const Color lowest{std::min(ad.r, bc.r), std::min(ad.g, bc.g), std::min(ad.b, bc.b), std::min(ad.a, bc.a)};
        return preserve_high_channels(lowest, ad, bc);
    }

    if (ctx_.colors.is_boundary) {
        if (direct) return corners[0];
        const float range = ctx_.colors.max_height - ctx_.colors.min_height;
        const float factor =
            range > min_height_range ? std::clamp((y - ctx_.colors.min_height) / range, 0.0f, 1.0f) : 0.5f;

        Color c;
        if (factor < lower_t) {
            c = lower;
        } else if (factor > upper_t) {
            c = upper;
        } else {
            c = texslot::lerp(lower, upper, (factor - lower_t) / (upper_t - lower_t));
        }
        return texslot::snap_to_one_hot(c);
    }

    if (direct) return corners[0];
    const Color ab = texslot::lerp(corners[0], corners[1], x);
    const Color cd = texslot::lerp(corners[2], corners[3], x);
    return texslot::snap_to_one_hot(texslot::lerp(ab, cd, z));
}

void CellBuilder::add_point(float x, float y, float z, float uv_x, float uv_y, bool diagonal_midpoint) {
    const int cx = ctx_.cell_x;
    const int cz = ctx_.cell_z;

    if (!std::isfinite(x)) {
        warn("NONFINITE_INPUT", std::format("non-finite x at cell ({}, {}), using 0.5", cx, cz));
        x = 0.5f;
    }
    if (!std::isfinite(y)) {
        warn("NONFINITE_INPUT", std::format("non-finite y at cell ({}, {}), using 0.0", cx, cz));
        y = 0.0f;
    }
    if (!std::isfinite(z)) {
        warn("NONFINITE_INPUT", std::format("non-finite z at cell ({}, {}), using 0.5", cx, cz));
        z = 0.5f;
    }

    for (int i = 0; i < ctx_.rotation; ++i) {
        const float t = x;
        x = 1.0f - z;
        z = t;
    }
    if (!std::isfinite(x) || !std::isfinite(z)) {
        warn("NONFINITE_ROTATION", std::format("non-finite coordinate after rotation at cell ({}, {})", cx, cz));
        x = 0.5f;
        z = 0.5f;
    }

    const Vec2 uv = floor_mode_ ? Vec2{uv_x, uv_y} : Vec2{1.0f, 1.0f};
    const bool is_ridge = floor_mode_ && config_.use_ridge_texture && uv.y > 1.0f - config_.ridge_threshold;
    const bool wall_colors = !floor_mode_ || is_ridge;

    Color color_0 = texslot::default_texture_color;
    Color color_1 = texslot::default_texture_color;
    Color grass_mask{1.0f, 0.0f, 0.0f, 1.0f};
    Color blend{0.0f, 0.0f, 1.0f, 0.0f};

    const bool has_maps = maps_.valid() && maps_.contains(cx, cz) && maps_.contains(cx + 1, cz + 1);
    if (has_maps) {
        const auto idx = ctx_.corner_indices(maps_);
        const auto& map_0 = wall_colors ? maps_.wall_color_0 : maps_.color_0;
        const auto& map_1 = wall_colors ? maps_.wall_color_1 : maps_.color_1;
        const auto& s = ctx_.colors;

        const std::array<Color, 4> c0 = {map_0[idx[0]], map_0[idx[1]], map_0[idx[2]], map_0[idx[3]]};
        const std::array<Color, 4> c1 = {map_1[idx[0]], map_1[idx[1]], map_1[idx[2]], map_1[idx[3]]};

        color_0 = vertex_color(c0, wall_colors ? s.wall_lower_color_0 : s.floor_lower_color_0,
                               wall_colors ? s.wall_upper_color_0 : s.floor_upper_color_0,
                               config_.lower_threshold, config_.upper_threshold, x, y, z, diagonal_midpoint);
        color_1 = vertex_color(c1, wall_colors ? s.wall_lower_color_1 : s.floor_lower_color_1,
                               wall_colors ? s.wall_upper_color_1 : s.floor_upper_color_1,
                               color_1_lower_threshold, color_1_upper_threshold, x, y, z, diagonal_midpoint);

        grass_mask = maps_.grass_mask[idx[0]];
        blend = material_blend(ctx_, maps_, wall_colors, x, z);
    }

    grass_mask.g = is_ridge ? 1.0f : 0.0f;
    grass_mask.b = floor_mode_ ? 1.0f : 0.0f;

    if (floor_mode_ && !all_edges_blend_merged()) blend.a = wall_blend_sentinel;

    Vec3 pos{(static_cast<float>(cx) + x) * config_.cell_size.x, y, (static_cast<float>(cz) + z) * config_.cell_size.y};
    if (!finite3(pos)) {
        warn("NONFINITE_POSITION", std::format("non-finite vertex at cell ({}, {}), using cell centre", cx, cz));
        pos = {(static_cast<float>(cx) + 0.5f) * config_.cell_size.x, std::isfinite(pos.y) ? pos.y : 0.0f,
               (static_cast<float>(cz) + 0.5f) * config_.cell_size.y};
        if (!finite3(pos)) pos = {0.0f, 0.0f, 0.0f};
    }

    Vec2 uv2;
    if (floor_mode_) {
        uv2 = {pos.x / config_.cell_size.x, pos.z / config_.cell_size.y};
    } else {
        const Vec3 g{pos.x + config_.chunk_position.x, pos.y + config_.chunk_position.y,
                     pos.z + config_.chunk_position.z};
        uv2 = {g.x + g.z, g.y + g.y};
    }
    if (!std::isfinite(uv2.x) || !std::isfinite(uv2.y)) uv2 = {0.0f, 0.0f};

    out_.positions.push_back(pos);
    out_.uvs.push_back(uv);
    out_.uv2s.push_back(uv2);
    out_.colors_0.push_back(color_0);
    out_.colors_1.push_back(color_1);
    out_.grass_mask.push_back(grass_mask);
    out_.material_blend.push_back(blend);
    out_.is_floor.push_back(floor_mode_);
}

} // namespace terratools::marching
