#include "terratools/grass.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace terratools::grass {

namespace {

constexpr float degenerate_epsilon = 1e-8f;

[[nodiscard]] Vec3 sub(const Vec3& a, const Vec3& b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
[[nodiscard]] Vec3 scale(const Vec3& a, float s) { return {a.x * s, a.y * s, a.z * s}; }

[[nodiscard]] Vec3 cross(const Vec3& a, const Vec3& b) {
    return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

[[nodiscard]] float length(const Vec3& v) { return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z); }

[[nodiscard]] Vec3 normalize_or(const Vec3& v, const Vec3& fallback) {
    const float len = length(v);
    if (!(len > 1e-6f) || !std::isfinite(len)) return fallback;
    return scale(v, 1.0f / len);
}

[[nodiscard]] float dot(Vec2 a, Vec2 b) { return a.x * b.x + a.y * b.y; }

[[nodiscard]] float mix3(float a, float b, float c, const Barycentric& w) {
    return a * w.w + b * w.v + c * w.u;
}

[[nodiscard]] Vec2 mix3(const Vec2& a, const Vec2& b, const Vec2& c, const Barycentric& w) {
    return {mix3(a.x, b.x, c.x, w), mix3(a.y, b.y, c.y, w)};
}

[[nodiscard]] Vec3 mix3(const Vec3& a, const Vec3& b, const Vec3& c, const Barycentric& w) {
    return {mix3(a.x, b.x, c.x, w), mix3(a.y, b.y, c.y, w), mix3(a.z, b.z, c.z, w)};
}

[[nodiscard]] Color mix3(const Color& a, const Color& b, const Color& c, const Barycentric& w) {
    return {mix3(a.r, b.r, c.r, w), mix3(a.g, b.g, c.g, w), mix3(a.b, b.b, c.b, w), mix3(a.a, b.a, c.a, w)};
}

std::vector<Hit> claim(const TriangleXZ& tri, std::vector<Vec2>& pool) {
    std::vector<Hit> hits;
    size_t i = 0;
    while (i < pool.size()) {
        Barycentric w;
        if (tri.locate(pool[i], w)) {
            hits.push_back({pool[i], w});
            pool[i] = pool.back();
            pool.pop_back();
            continue;
        }
        ++i;
    }
    return hits;
}

[[nodiscard]] Sample interpolate(const marching::CellGeometry& geo, size_t i0, const Barycentric& w) {
    const size_t i1 = i0 + 1;
    const size_t i2 = i0 + 2;
    return {
        mix3(geo.positions[i0], geo.positions[i1], geo.positions[i2], w),
        mix3(geo.uvs[i0], geo.uvs[i1], geo.uvs[i2], w),
        mix3(geo.colors_0[i0], geo.colors_0[i1], geo.colors_0[i2], w),
        mix3(geo.colors_1[i0], geo.colors_1[i1], geo.colors_1[i2], w),
        mix3(geo.grass_mask[i0], geo.grass_mask[i1], geo.grass_mask[i2], w),
    };
}

} // namespace

Rng::Rng(uint64_t seed) : state_(seed ^ 0x853C49E6748FEA9BULL) {
    if (state_ == 0) state_ = 0x853C49E6748FEA9BULL;
}

// xorshift64*, top 24 bits
float Rng::next() {
    state_ ^= state_ >> 12;
    state_ ^= state_ << 25;
    state_ ^= state_ >> 27;
    const uint64_t bits = (state_ * 0x2545F4914F6CDD1DULL) >> 40;
    return static_cast<float>(bits) * (1.0f / 16777216.0f);
}

float Rng::next_in(float lo, float hi) {
    if (!(hi > lo)) return lo;
    const float v = lo + (hi - lo) * next();
    return v < hi ? v : std::nextafter(hi, lo);
}

std::vector<Vec2> stratified_samples(int cell_x, int cell_z, int subdivisions, Vec2 cell_size, Rng& rng) {
    std::vector<Vec2> points;
    if (subdivisions < 1) return points;
    points.reserve(static_cast<size_t>(subdivisions) * static_cast<size_t>(subdivisions));

    const float sub_x = cell_size.x / static_cast<float>(subdivisions);
    const float sub_z = cell_size.y / static_cast<float>(subdivisions);
    const float origin_x = static_cast<float>(cell_x) * cell_size.x;
    const float origin_z = static_cast<float>(cell_z) * cell_size.y;
    for (int z = 0; z < subdivisions; ++z) {
        const float z0 = origin_z + static_cast<float>(z) * sub_z;
        for (int x = 0; x < subdivisions; ++x) {
            const float x0 = origin_x + static_cast<float>(x) * sub_x;
            points.push_back({rng.next_in(x0, x0 + sub_x), rng.next_in(z0, z0 + sub_z)});
        }
    }
    return points;
}

TriangleXZ::TriangleXZ(const Vec3& a, const Vec3& b, const Vec3& c)
    : a_{a.x, a.z}, v0_{c.x - a.x, c.z - a.z}, v1_{b.x - a.x, b.z - a.z} {
    d00_ = dot(v0_, v0_);
    d01_ = dot(v0_, v1_);
    d11_ = dot(v1_, v1_);
    const float denom = d00_ * d11_ - d01_ * d01_;
    degenerate_ = !(std::abs(denom) >= degenerate_epsilon);
    inv_denom_ = degenerate_ ? 0.0f : 1.0f / denom;
}

bool TriangleXZ::locate(Vec2 p, Barycentric& out) const {
    if (degenerate_) return false;
    const Vec2 v2{p.x - a_.x, p.y - a_.y};
    const float d20 = dot(v2, v0_);
    const float d21 = dot(v2, v1_);
    const float u = (d11_ * d20 - d01_ * d21) * inv_denom_;
    const float v = (d00_ * d21 - d01_ * d20) * inv_denom_;
    if (!(u >= 0.0f && v >= 0.0f && u + v <= 1.0f)) return false;
    out = {u, v, 1.0f - u - v};
    return true;
}

std::vector<Hit> claim_points(const Vec3& a, const Vec3& b, const Vec3& c, std::vector<Vec2>& pool) {
    const TriangleXZ tri(a, b, c);
    if (tri.degenerate()) return {};
    return claim(tri, pool);
}

Rejection classify_sample(const Sample& s, const GrassConfig& config, int& slot) {
    slot = -1;
    if (s.uv.x > 1.0f - config.ledge_threshold) return Rejection::Ledge;
    if (s.uv.y > 1.0f - config.ridge_threshold) return Rejection::Ridge;

    const bool forced = s.grass_mask.g >= mask_threshold;
    if (s.grass_mask.r < mask_threshold && !forced) return Rejection::Masked;

    slot = texslot::encode(s.color_0, s.color_1);
    if (slot >= grass_slot_count) return Rejection::Slot;
    if (slot >= 1 && !config.tex_has_grass[static_cast<size_t>(slot - 1)] && !forced) return Rejection::Slot;
    return Rejection::None;
}

float instance_alpha(int slot) {
    return 1.0f - 0.2f * static_cast<float>(slot);
}

Color ground_tint(const GrassConfig& config, int slot, const Vec3& position) {
    if (slot < 0 || slot >= grass_slot_count) return texslot::default_texture_color;
    const auto idx = static_cast<size_t>(slot);

    const auto& image = config.ground_images[idx];
    if (!image || image->empty()) return config.ground_colors[idx];

    const float span_x = config.cell_size.x * static_cast<float>(std::max(config.cells_x(), 1));
    const float span_z = config.cell_size.y * static_cast<float>(std::max(config.cells_z(), 1));
    const float s = config.texture_scales[idx];
    const auto px = tga::sample_wrapped(*image, position.x * s / span_x, position.z * s / span_z);
    return {px[0], px[1], px[2], px[3]};
}

Instance hidden_instance() {
    Instance inst;
    inst.origin = {0.0f, hidden_origin_y, 0.0f};
    inst.color = {0.0f, 0.0f, 0.0f, 0.0f};
    return inst;
}

Instance billboard_instance(const Vec3& origin, const Vec3& normal, Vec2 grass_size, const Color& color) {
    const Vec3 up = normalize_or(normal, {0.0f, 1.0f, 0.0f});
    const Vec3 x = normalize_or(cross(up, {0.0f, 0.0f, 1.0f}), {1.0f, 0.0f, 0.0f});
    const Vec3 z = cross(x, up);

    Instance inst;
    inst.basis_x = scale(x, grass_size.x);
    inst.basis_y = scale(up, grass_size.y);
    inst.basis_z = scale(z, grass_size.x);
    inst.origin = origin;
    inst.color = color;
    return inst;
}

InstanceBuffer::InstanceBuffer(int cells_x, int cells_z, int per_cell) {
    reserve(cells_x, cells_z, per_cell);
}

void InstanceBuffer::reserve(int cells_x, int cells_z, int per_cell) {
    cells_x_ = std::max(cells_x, 0);
    cells_z_ = std::max(cells_z, 0);
    per_cell_ = std::max(per_cell, 0);
    const size_t needed =
        static_cast<size_t>(cells_x_) * static_cast<size_t>(cells_z_) * static_cast<size_t>(per_cell_);
    if (needed > instances_.size()) instances_.resize(needed, hidden_instance());
}

void InstanceBuffer::hide_all() {
    std::fill(instances_.begin(), instances_.end(), hidden_instance());
}

size_t InstanceBuffer::cell_base(int cell_x, int cell_z) const {
    return (static_cast<size_t>(cell_z) * static_cast<size_t>(cells_x_) + static_cast<size_t>(cell_x)) *
           static_cast<size_t>(per_cell_);
}

size_t InstanceBuffer::visible_count() const {
    return static_cast<size_t>(std::count_if(instances_.begin(), instances_.end(),
                                             [](const Instance& i) { return i.origin.y != hidden_origin_y; }));
}

std::vector<float> InstanceBuffer::flatten() const {
    std::vector<float> out;
    out.reserve(instances_.size() * 16);
    for (const auto& i : instances_) {
        for (const Vec3* v : {&i.basis_x, &i.basis_y, &i.basis_z, &i.origin}) {
            out.push_back(v->x);
            out.push_back(v->y);
            out.push_back(v->z);
        }
        out.push_back(i.color.r);
        out.push_back(i.color.g);
        out.push_back(i.color.b);
        out.push_back(i.color.a);
    }
    return out;
}

PlacementStats& PlacementStats::operator+=(const PlacementStats& o) {
    placed += o.placed;
    rejected_ledge += o.rejected_ledge;
    rejected_ridge += o.rejected_ridge;
    rejected_mask += o.rejected_mask;
    rejected_slot += o.rejected_slot;
    degenerate_skipped += o.degenerate_skipped;
    hidden += o.hidden;
    return *this;
}

GrassPlanter::GrassPlanter(GrassConfig config) : config_(std::move(config)) {
    config_.subdivisions = std::max(config_.subdivisions, 1);
    buffer_.reserve(config_.cells_x(), config_.cells_z(), config_.subdivisions * config_.subdivisions);
}

PlacementStats GrassPlanter::plant_cell(int cell_x, int cell_z, const marching::CellGeometry& geo, Rng& rng) {
    return plant_cell(cell_x, cell_z, geo,
                      stratified_samples(cell_x, cell_z, config_.subdivisions, config_.cell_size, rng));
}

PlacementStats GrassPlanter::plant_cell(int cell_x, int cell_z, const marching::CellGeometry& geo,
                                        std::vector<Vec2> candidates) {
    PlacementStats stats;
    if (cell_x < 0 || cell_z < 0 || cell_x >= config_.cells_x() || cell_z >= config_.cells_z()) return stats;

    const size_t base = buffer_.cell_base(cell_x, cell_z);
    const auto per_cell = static_cast<size_t>(buffer_.per_cell());
    size_t used = 0;

    if (geo.consistent()) {
        for (size_t t = 0; t < geo.triangle_count() && !candidates.empty(); ++t) {
            const size_t i0 = t * 3;
            if (!geo.is_floor[i0]) continue;

            const Vec3& a = geo.positions[i0];
            const Vec3& b = geo.positions[i0 + 1];
            const Vec3& c = geo.positions[i0 + 2];
            const TriangleXZ tri(a, b, c);
            if (tri.degenerate()) {
                ++stats.degenerate_skipped;
                continue;
            }

            const auto hits = claim(tri, candidates);
            if (hits.empty()) continue;
            const Vec3 normal = cross(sub(c, a), sub(b, a));

            for (const auto& hit : hits) {
                const Sample s = interpolate(geo, i0, hit.weights);
                int slot = -1;
                switch (classify_sample(s, config_, slot)) {
                    case Rejection::Ledge: ++stats.rejected_ledge; continue;
                    case Rejection::Ridge: ++stats.rejected_ridge; continue;
                    case Rejection::Masked: ++stats.rejected_mask; continue;
                    case Rejection::Slot: ++stats.rejected_slot; continue;
                    case Rejection::None: break;
                }
                if (used >= per_cell) continue;

                Color color = ground_tint(config_, slot, s.position);
                color.a = instance_alpha(slot);
                buffer_.at(base + used) = billboard_instance(s.position, normal, config_.grass_size, color);
                ++used;
                ++stats.placed;
            }
        }
    }

    for (size_t i = used; i < per_cell; ++i) buffer_.at(base + i) = hidden_instance();
    stats.hidden = per_cell - used;
    return stats;
}

PlacementStats GrassPlanter::regenerate(std::span<const marching::CellGeometry> cells, Rng& rng) {
    buffer_.reserve(config_.cells_x(), config_.cells_z(), config_.subdivisions * config_.subdivisions);
    buffer_.hide_all();

    PlacementStats total;
    const int cells_x = config_.cells_x();
    const int cells_z = config_.cells_z();
    for (int cz = 0; cz < cells_z; ++cz) {
        for (int cx = 0; cx < cells_x; ++cx) {
            const size_t idx = static_cast<size_t>(cz) * static_cast<size_t>(cells_x) + static_cast<size_t>(cx);
            if (idx >= cells.size()) break;
            total += plant_cell(cx, cz, cells[idx], rng);
        }
    }
    total.hidden = buffer_.capacity() - total.placed;
    return total;
}

} // namespace terratools::grass
