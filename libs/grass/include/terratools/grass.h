#pragma once

#include <terratools/marching.h>
#include <terratools/tga.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace terratools::grass {

using marching::Vec2;
using marching::Vec3;
using texslot::Color;

inline constexpr int grass_slot_count = 6;
inline constexpr float mask_threshold = 0.9999f;
inline constexpr float hidden_origin_y = -10000.0f;

struct GrassConfig {
    std::array<int, 3> dimensions{33, 32, 33}; // grid points x, height scale, grid points z
    int subdivisions = 3;
    Vec2 grass_size{1.0f, 1.0f};
    Vec2 cell_size{2.0f, 2.0f};
    float ledge_threshold = 0.25f;
    float ridge_threshold = 1.0f;
    std::array<Color, grass_slot_count> ground_colors{
        Color{0.4f, 0.5f, 0.3f, 1.0f}, Color{0.4f, 0.5f, 0.3f, 1.0f}, Color{0.4f, 0.5f, 0.3f, 1.0f},
        Color{0.4f, 0.5f, 0.3f, 1.0f}, Color{0.4f, 0.5f, 0.3f, 1.0f}, Color{0.4f, 0.5f, 0.3f, 1.0f},
    };
    // toggles for slots 1..5; slot 0 always carries grass
    std::array<bool, grass_slot_count - 1> tex_has_grass{true, true, true, true, true};
    std::array<float, grass_slot_count> texture_scales{1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f};
    std::array<std::shared_ptr<const tga::Image>, grass_slot_count> ground_images{};
    uint64_t seed = 0;

    [[nodiscard]] int cells_x() const { return dimensions[0] - 1; }
    [[nodiscard]] int cells_z() const { return dimensions[2] - 1; }
};

// Rng draws placement jitter. The same seed replays the same instances, so a
// planter regenerates identically from one Rng per chunk.
class Rng {
public:
    explicit Rng(uint64_t seed);

    // next returns a value in [0, 1).
    [[nodiscard]] float next();
    // next_in returns a value in [lo, hi), or lo when the range is empty.
    [[nodiscard]] float next_in(float lo, float hi);

private:
    uint64_t state_;
};

// stratified_samples returns subdivisions^2 world-space XZ points for cell
// (cell_x, cell_z), one uniformly jittered point per sub-cell.
[[nodiscard]] std::vector<Vec2> stratified_samples(int cell_x, int cell_z, int subdivisions, Vec2 cell_size,
                                                   Rng& rng);

// Barycentric weights of a point; w pairs with the first vertex, v with the
// second, u with the third.
struct Barycentric {
    float u = 0.0f;
    float v = 0.0f;
    float w = 0.0f;
};

// TriangleXZ precomputes the XZ-projected barycentric system of one triangle.
class TriangleXZ {
public:
    TriangleXZ(const Vec3& a, const Vec3& b, const Vec3& c);

    [[nodiscard]] bool degenerate() const { return degenerate_; }
    // locate returns true and the weights when p lies inside or on the triangle.
    [[nodiscard]] bool locate(Vec2 p, Barycentric& out) const;

private:
    Vec2 a_;
    Vec2 v0_;
    Vec2 v1_;
    float d00_ = 0.0f;
    float d01_ = 0.0f;
    float d11_ = 0.0f;
    float inv_denom_ = 0.0f;
    bool degenerate_ = false;
};

struct Hit {
    Vec2 point;
    Barycentric weights;
};

// claim_points removes every pool point that falls inside triangle (a, b, c)
// and returns them with their weights. Order of the remaining pool is not
// preserved.
[[nodiscard]] std::vector<Hit> claim_points(const Vec3& a, const Vec3& b, const Vec3& c, std::vector<Vec2>& pool);

// Interpolated per-point attributes of a floor triangle.
struct Sample {
    Vec3 position;
    Vec2 uv;
    Color color_0;
    Color color_1;
    Color grass_mask;
};

enum class Rejection { None, Ledge, Ridge, Masked, Slot };

// classify_sample applies the rejection rules in order: ledge, ridge, painted
// mask, texture slot. A mask green channel at or above 0.9999 forces grass
// past the painted mask and the slot toggles, but not past slot ids outside
// the grass-capable range.
// Limitation: the geometry writes its ridge flag into the green channel of
// every vertex, so a force-enable painted on the grid never reaches this
// check. The green channel seen here comes from ridge floors only.
[[nodiscard]] Rejection classify_sample(const Sample& s, const GrassConfig& config, int& slot);

// instance_alpha maps a texture slot to its packed alpha constant.
[[nodiscard]] float instance_alpha(int slot);

// ground_tint samples the slot's ground image at the world position, or
// returns the configured ground color when no image is loaded.
[[nodiscard]] Color ground_tint(const GrassConfig& config, int slot, const Vec3& position);

struct Instance {
    Vec3 basis_x;
    Vec3 basis_y;
    Vec3 basis_z;
    Vec3 origin;
    Color color;
};

[[nodiscard]] Instance hidden_instance();

// billboard_instance orients a blade along the triangle normal.
[[nodiscard]] Instance billboard_instance(const Vec3& origin, const Vec3& normal, Vec2 grass_size, const Color& color);

// InstanceBuffer is a fixed-capacity buffer with one block of
// subdivisions^2 slots per cell.
class InstanceBuffer {
public:
    InstanceBuffer() = default;
    InstanceBuffer(int cells_x, int cells_z, int per_cell);

    // reserve grows the buffer to fit the layout; capacity never shrinks.
    void reserve(int cells_x, int cells_z, int per_cell);
    void hide_all();

    [[nodiscard]] size_t capacity() const { return instances_.size(); }
    [[nodiscard]] int per_cell() const { return per_cell_; }
    [[nodiscard]] size_t cell_base(int cell_x, int cell_z) const;
    [[nodiscard]] const std::vector<Instance>& instances() const { return instances_; }
    [[nodiscard]] Instance& at(size_t i) { return instances_[i]; }
    [[nodiscard]] size_t visible_count() const;

    // flatten writes 12 floats of basis and origin then 4 floats of color
    // per instance.
    [[nodiscard]] std::vector<float> flatten() const;

private:
    std::vector<Instance> instances_;
    int cells_x_ = 0;
    int cells_z_ = 0;
    int per_cell_ = 0;
};

struct PlacementStats {
    size_t placed = 0;
    size_t rejected_ledge = 0;
    size_t rejected_ridge = 0;
    size_t rejected_mask = 0;
    size_t rejected_slot = 0;
    size_t degenerate_skipped = 0;
    size_t hidden = 0;

    PlacementStats& operator+=(const PlacementStats& o);
};

class GrassPlanter {
public:
    explicit GrassPlanter(GrassConfig config);

    [[nodiscard]] const GrassConfig& config() const { return config_; }
    [[nodiscard]] const InstanceBuffer& buffer() const { return buffer_; }

    // plant_cell places grass for one cell from the given candidates. The
    // cell's instance block is rewritten; unused slots are hidden.
    PlacementStats plant_cell(int cell_x, int cell_z, const marching::CellGeometry& geo,
                              std::vector<Vec2> candidates);
    PlacementStats plant_cell(int cell_x, int cell_z, const marching::CellGeometry& geo, Rng& rng);

    // regenerate rebuilds every cell; cells are given in row-major order and
    // must number cells_x * cells_z.
    PlacementStats regenerate(std::span<const marching::CellGeometry> cells, Rng& rng);

private:
    GrassConfig config_;
    InstanceBuffer buffer_;
};

} // namespace terratools::grass
