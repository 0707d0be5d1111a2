#include "terratools/terrain.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

namespace terratools::terrain {

namespace {

template <typename T>
void append(std::vector<T>& dst, const std::vector<T>& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

} // namespace

Chunk::Chunk(TerrainConfig config, int chunk_x, int chunk_z)
    : config_(std::move(config)), chunk_x_(chunk_x), chunk_z_(chunk_z) {
    config_.dimensions.x = std::max(config_.dimensions.x, 2);
    config_.dimensions.z = std::max(config_.dimensions.z, 2);
    reset_maps();
    cells_.resize(static_cast<size_t>(cells_x()) * static_cast<size_t>(cells_z()));
    dirty_.assign(cells_.size(), 1);
}

void Chunk::reset_maps() {
    maps_.width = config_.dimensions.x;
    maps_.depth = config_.dimensions.z;
    const size_t n = static_cast<size_t>(maps_.width) * static_cast<size_t>(maps_.depth);
    maps_.heights.assign(n, 0.0f);
    maps_.color_0.assign(n, texslot::default_texture_color);
    maps_.color_1.assign(n, texslot::default_texture_color);
    maps_.wall_color_0.assign(n, texslot::default_texture_color);
    maps_.wall_color_1.assign(n, texslot::default_texture_color);
    maps_.grass_mask.assign(n, default_grass_mask);
}

Vec3 Chunk::position() const {
    return {
        static_cast<float>(chunk_x_ * cells_x()) * config_.cell_size.x,
        0.0f,
        static_cast<float>(chunk_z_ * cells_z()) * config_.cell_size.y,
    };
}

marching::CellConfig Chunk::cell_config() const {
    marching::CellConfig cc;
    cc.cell_size = config_.cell_size;
    cc.merge_threshold = marching::merge_threshold(config_.merge_mode);
    cc.higher_poly_floors = config_.higher_poly_floors;
    cc.blend_mode = config_.blend_mode;
    cc.use_ridge_texture = config_.use_ridge_texture;
    cc.ridge_threshold = config_.ridge_threshold;
    cc.lower_threshold = config_.lower_threshold;
    cc.upper_threshold = config_.upper_threshold;
    cc.is_new_chunk = new_chunk_;
    cc.chunk_position = position();
    return cc;
}

float Chunk::height(int x, int z) const {
    if (!maps_.contains(x, z)) return 0.0f;
    return maps_.heights[maps_.index(x, z)];
}

void Chunk::set_height(int x, int z, float h) {
    if (!maps_.contains(x, z)) return;
    if (!std::isfinite(h)) {
        warnings_.push_back({"NONFINITE_HEIGHT", std::format("non-finite height at ({}, {}), using 0", x, z)});
        h = 0.0f;
    }
    maps_.heights[maps_.index(x, z)] = h;
    touch_point(x, z);
}

Color Chunk::get_color(const std::vector<Color>& map, int x, int z, const Color& fallback) const {
    if (!maps_.contains(x, z)) return fallback;
    return map[maps_.index(x, z)];
}

void Chunk::set_color(std::vector<Color>& map, int x, int z, const Color& c) {
    if (!maps_.contains(x, z)) return;
    map[maps_.index(x, z)] = c;
    touch_point(x, z);
}

Color Chunk::color_0(int x, int z) const { return get_color(maps_.color_0, x, z, texslot::default_texture_color); }
void Chunk::set_color_0(int x, int z, const Color& c) { set_color(maps_.color_0, x, z, c); }
Color Chunk::color_1(int x, int z) const { return get_color(maps_.color_1, x, z, texslot::default_texture_color); }
void Chunk::set_color_1(int x, int z, const Color& c) { set_color(maps_.color_1, x, z, c); }
Color Chunk::wall_color_0(int x, int z) const {
    return get_color(maps_.wall_color_0, x, z, texslot::default_texture_color);
}
void Chunk::set_wall_color_0(int x, int z, const Color& c) { set_color(maps_.wall_color_0, x, z, c); }
Color Chunk::wall_color_1(int x, int z) const {
    return get_color(maps_.wall_color_1, x, z, texslot::default_texture_color);
}
void Chunk::set_wall_color_1(int x, int z, const Color& c) { set_color(maps_.wall_color_1, x, z, c); }
Color Chunk::grass_mask(int x, int z) const { return get_color(maps_.grass_mask, x, z, default_grass_mask); }
void Chunk::set_grass_mask(int x, int z, const Color& c) { set_color(maps_.grass_mask, x, z, c); }

// touch_point dirties the up to four cells that share grid point (x, z).
void Chunk::touch_point(int x, int z) {
    for (int cz = z - 1; cz <= z; ++cz) {
        for (int cx = x - 1; cx <= x; ++cx) {
            if (has_cell(cx, cz)) mark_cell_dirty(cx, cz);
        }
    }
}

void Chunk::mark_cell_dirty(int cell_x, int cell_z) {
    for (int cz = cell_z - 1; cz <= cell_z + 1; ++cz) {
        for (int cx = cell_x - 1; cx <= cell_x + 1; ++cx) {
            if (!has_cell(cx, cz)) continue;
            const size_t i = cell_index(cx, cz);
            dirty_[i] = 1;
            cells_[i].clear();
        }
    }
}

void Chunk::mark_all_dirty() {
    std::fill(dirty_.begin(), dirty_.end(), uint8_t(1));
    for (auto& geo : cells_) geo.clear();
}

bool Chunk::is_cell_dirty(int cell_x, int cell_z) const {
    return has_cell(cell_x, cell_z) && dirty_[cell_index(cell_x, cell_z)] != 0;
}

size_t Chunk::dirty_count() const {
    return static_cast<size_t>(std::count(dirty_.begin(), dirty_.end(), uint8_t(1)));
}

size_t Chunk::regenerate() {
    const marching::CellConfig cc = cell_config();
    size_t rebuilt = 0;

    for (int cz = 0; cz < cells_z(); ++cz) {
        for (int cx = 0; cx < cells_x(); ++cx) {
            const size_t i = cell_index(cx, cz);
            if (!dirty_[i]) continue;

            auto& geo = cells_[i];
            geo.clear();
            const auto ctx = marching::make_cell_context(maps_, cx, cz, cc.merge_threshold);
            marching::generate_cell(maps_, cc, ctx, geo);

            if (!geo.consistent()) {
                warnings_.push_back({"INVALID_GEOMETRY",
                                     std::format("cell ({}, {}) produced {} positions with mismatched attributes, "
                                                 "using flat floor", cx, cz, geo.positions.size())});
                geo.clear();
                marching::CellBuilder builder(maps_, cc, ctx, geo);
                marching::add_full_floor(builder);
            }
            for (const auto& w : geo.warnings) warnings_.push_back(w);

            dirty_[i] = 0;
            ++rebuilt;
        }
    }

    new_chunk_ = false;
    return rebuilt;
}

const marching::CellGeometry* Chunk::cell_geometry(int cell_x, int cell_z) const {
    if (!has_cell(cell_x, cell_z)) return nullptr;
    return &cells_[cell_index(cell_x, cell_z)];
}

marching::CellGeometry Chunk::assemble() const {
    marching::CellGeometry mesh;
    size_t total = 0;
    for (const auto& geo : cells_) total += geo.vertex_count();
    mesh.positions.reserve(total);

    for (const auto& geo : cells_) {
        append(mesh.positions, geo.positions);
        append(mesh.uvs, geo.uvs);
        append(mesh.uv2s, geo.uv2s);
        append(mesh.colors_0, geo.colors_0);
        append(mesh.colors_1, geo.colors_1);
        append(mesh.grass_mask, geo.grass_mask);
        append(mesh.material_blend, geo.material_blend);
        append(mesh.is_floor, geo.is_floor);
    }
    return mesh;
}

SavedChunk Chunk::save() const {
    return {maps_.heights, maps_.color_0, maps_.color_1, maps_.wall_color_0, maps_.wall_color_1, maps_.grass_mask};
}

bool Chunk::restore(const SavedChunk& saved) {
    const size_t n = maps_.heights.size();
    if (saved.heights.size() != n) return false;

    const auto pick = [n](const std::vector<Color>& src, const Color& fallback) {
        return src.size() == n ? src : std::vector<Color>(n, fallback);
    };

    maps_.heights = saved.heights;
    for (size_t i = 0; i < n; ++i) {
        if (std::isfinite(maps_.heights[i])) continue;
        warnings_.push_back({"NONFINITE_HEIGHT", std::format("non-finite saved height at index {}, using 0", i)});
        maps_.heights[i] = 0.0f;
    }
    maps_.color_0 = pick(saved.color_0, texslot::default_texture_color);
    maps_.color_1 = pick(saved.color_1, texslot::default_texture_color);
    maps_.wall_color_0 = pick(saved.wall_color_0, texslot::default_texture_color);
    maps_.wall_color_1 = pick(saved.wall_color_1, texslot::default_texture_color);
    maps_.grass_mask = pick(saved.grass_mask, default_grass_mask);

    new_chunk_ = false;
    mark_all_dirty();
    return true;
}

void Chunk::generate_heights(const NoiseParams& params) {
    const float scale = static_cast<float>(config_.dimensions.y);
    for (int z = 0; z < maps_.depth; ++z) {
        for (int x = 0; x < maps_.width; ++x) {
            const float n = noise_height(params, chunk_x_ * cells_x() + x, chunk_z_ * cells_z() + z);
            maps_.heights[maps_.index(x, z)] = n * scale;
        }
    }
    mark_all_dirty();
}

size_t Chunk::validate() {
    size_t open = 0;
    for (int cz = 0; cz < cells_z(); ++cz) {
        for (int cx = 0; cx < cells_x(); ++cx) {
            const auto& geo = cells_[cell_index(cx, cz)];
            if (geo.empty()) continue;
            const auto result = marching::validate_watertight(geo, cx, cz, config_.cell_size);
            for (const auto& [a, b] : result.open_edges) {
                warnings_.push_back({"OPEN_EDGE", std::format("cell ({}, {}) open edge ({}, {}, {}) - ({}, {}, {})",
                                                              cx, cz, a.x, a.y, a.z, b.x, b.y, b.z)});
            }
            open += result.open_edges.size();
        }
    }
    return open;
}

} // namespace terratools::terrain
