#pragma once

#include <terratools/texslot.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace terratools::marching {

using texslot::Color;

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;
};

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

// --- Constants ---

inline constexpr float blend_edge_sensitivity = 1.25f;
inline constexpr float dominant_channel_threshold = 0.99f;
inline constexpr float min_weight_threshold = 0.001f;
inline constexpr float min_height_range = 0.001f;
inline constexpr float material_pack_scale = 16.0f;
inline constexpr float material_pack_normalize = 255.0f;
inline constexpr float material_index_scale = 15.0f;
inline constexpr float color_1_lower_threshold = 0.3f;
inline constexpr float color_1_upper_threshold = 0.7f;
// Written to material_blend.a on floor vertices of cells that contain walls.
inline constexpr float wall_blend_sentinel = 2.0f;

// --- Modes ---

enum class MergeMode { Cubic, Polyhedron, RoundedPolyhedron, SemiRound, Spherical };

[[nodiscard]] float merge_threshold(MergeMode mode);
// merge_mode_from_index maps 0..4; anything else is Polyhedron.
[[nodiscard]] MergeMode merge_mode_from_index(int idx);
[[nodiscard]] int merge_mode_index(MergeMode mode);
[[nodiscard]] bool is_round(MergeMode mode);

enum class BlendMode { Interpolated = 0, Direct = 1 };

// --- Diagnostics ---

struct Warning {
    std::string code;    // e.g. "NONFINITE_INPUT"
    std::string message;
};

// --- Output ---

// CellGeometry holds one cell's triangles as parallel per-vertex arrays.
// Every three consecutive entries form one triangle; floor triangles wind
// clockwise when viewed from +Y.
struct CellGeometry {
    std::vector<Vec3> positions;
    std::vector<Vec2> uvs;            // x: cliff-bottom proximity, y: cliff-top proximity
    std::vector<Vec2> uv2s;           // world-projected texture coordinates
    std::vector<Color> colors_0;
    std::vector<Color> colors_1;
    std::vector<Color> grass_mask;    // r: painted mask, g: ridge (forces grass), b: floor flag
    std::vector<Color> material_blend;
    std::vector<bool> is_floor;

    std::vector<Warning> warnings;

    [[nodiscard]] size_t vertex_count() const { return positions.size(); }
    [[nodiscard]] size_t triangle_count() const { return positions.size() / 3; }
    [[nodiscard]] bool empty() const { return positions.empty(); }
    // consistent reports equal array lengths and whole triangles.
    [[nodiscard]] bool consistent() const;
    void clear();
};

// --- Input ---

// GridMaps is the read-only view of the grid provider's per-point data.
// All arrays are row-major with index z * width + x.
struct GridMaps {
    int width = 0;
    int depth = 0;
    std::vector<float> heights;
    std::vector<Color> color_0;
    std::vector<Color> color_1;
    std::vector<Color> wall_color_0;
    std::vector<Color> wall_color_1;
    std::vector<Color> grass_mask;

    [[nodiscard]] size_t index(int x, int z) const {
        return static_cast<size_t>(z) * static_cast<size_t>(width) + static_cast<size_t>(x);
    }
    [[nodiscard]] bool contains(int x, int z) const { return x >= 0 && z >= 0 && x < width && z < depth; }
    // valid reports that every map holds width * depth entries.
    [[nodiscard]] bool valid() const;
};

// CellConfig is constant across all cells of one generation pass.
struct CellConfig {
    Vec2 cell_size{2.0f, 2.0f};
    float merge_threshold = 1.3f;
    bool higher_poly_floors = true;
    BlendMode blend_mode = BlendMode::Interpolated;
    bool use_ridge_texture = false;
    float ridge_threshold = 1.0f;
    float lower_threshold = 0.3f;
    float upper_threshold = 0.7f;
    bool is_new_chunk = false;
    Vec3 chunk_position;
};

// --- Cell context ---

// BoundaryProfile describes the height along one cell edge. A merged edge is
// a linear slope; a walled edge has a distinct upper and lower side.
struct BoundaryProfile {
    float h1 = 0.0f;
    float h2 = 0.0f;
    bool merged = true;

    [[nodiscard]] float height_at(float t, bool upper) const;
};

[[nodiscard]] BoundaryProfile make_boundary_profile(float h1, float h2, float threshold);

struct CellColorState {
    float min_height = 0.0f;
    float max_height = 0.0f;
    bool is_boundary = false;

    Color floor_lower_color_0;
    Color floor_upper_color_0;
    Color floor_lower_color_1;
    Color floor_upper_color_1;
    Color wall_lower_color_0;
    Color wall_upper_color_0;
    Color wall_lower_color_1;
    Color wall_upper_color_1;

    uint8_t material_a = 0;
    uint8_t material_b = 0;
    uint8_t material_c = 0;
};

// CellContext is the per-cell input. Corner heights are stored [A, B, D, C]
// and edge flags [AB, BD, CD, AC] so that a rotation is a cyclic shift.
struct CellContext {
    std::array<float, 4> heights{};
    std::array<bool, 4> edges{true, true, true, true};
    std::array<BoundaryProfile, 4> profiles{};
    int rotation = 0;
    int cell_x = 0;
    int cell_z = 0;
    float merge_threshold = 1.3f;
    CellColorState colors;

    [[nodiscard]] float ay() const { return heights[static_cast<size_t>(rotation % 4)]; }
    [[nodiscard]] float by() const { return heights[static_cast<size_t>((rotation + 1) % 4)]; }
    [[nodiscard]] float dy() const { return heights[static_cast<size_t>((rotation + 2) % 4)]; }
    [[nodiscard]] float cy() const { return heights[static_cast<size_t>((rotation + 3) % 4)]; }
    [[nodiscard]] bool ab() const { return edges[static_cast<size_t>(rotation % 4)]; }
    [[nodiscard]] bool bd() const { return edges[static_cast<size_t>((rotation + 1) % 4)]; }
    [[nodiscard]] bool cd() const { return edges[static_cast<size_t>((rotation + 2) % 4)]; }
    [[nodiscard]] bool ac() const { return edges[static_cast<size_t>((rotation + 3) % 4)]; }

    // rotate advances the rotation by n quarter turns; n may be negative.
    void rotate(int n);

    [[nodiscard]] bool is_higher(float a, float b) const { return a - b > merge_threshold; }
    [[nodiscard]] bool is_lower(float a, float b) const { return a - b < -merge_threshold; }
    [[nodiscard]] bool is_merged(float a, float b) const;

    // Rotation-aware edge profile lookups. t=0 is the first named corner.
    [[nodiscard]] float ab_height(float t, bool upper) const;
    [[nodiscard]] float bd_height(float t, bool upper) const;
    [[nodiscard]] float cd_height(float t, bool upper) const;
    [[nodiscard]] float ac_height(float t, bool upper) const;

    // Grid indices of corners A, B, C, D (unrotated).
    [[nodiscard]] std::array<size_t, 4> corner_indices(const GridMaps& maps) const;
};

// make_cell_context reads the cell whose corner A is grid point (cell_x, cell_z)
// and precomputes edges, profiles, boundary colors and dominant materials.
[[nodiscard]] CellContext make_cell_context(const GridMaps& maps, int cell_x, int cell_z, float merge_threshold);

// make_cell_context from explicit heights [A, B, D, C]; color state stays
// default.
[[nodiscard]] CellContext make_cell_context(const std::array<float, 4>& heights, float merge_threshold);

void compute_boundary_colors(CellContext& ctx, const GridMaps& maps);
void compute_material_pair(CellContext& ctx, const GridMaps& maps);

// material_blend packs the cell's three dominant textures and the bilinear
// weights at unit-cell position (x, z).
[[nodiscard]] Color material_blend(const CellContext& ctx, const GridMaps& maps, bool wall_colors, float x, float z);

// --- Vertex factory ---

// CellBuilder is the single path every vertex takes into a CellGeometry.
// It keeps a working copy of the context so that primitives can rotate it.
class CellBuilder {
public:
    CellBuilder(const GridMaps& maps, const CellConfig& config, CellContext ctx, CellGeometry& out);

    [[nodiscard]] CellContext& context() { return ctx_; }
    [[nodiscard]] const CellContext& context() const { return ctx_; }
    [[nodiscard]] const CellConfig& config() const { return config_; }

    void start_floor() { floor_mode_ = true; }
    void start_wall() { floor_mode_ = false; }
    [[nodiscard]] bool floor_mode() const { return floor_mode_; }

    // add_point appends exactly one vertex record. x and z are logical
    // unit-cell coordinates in the current rotation, y is world height.
    void add_point(float x, float y, float z, float uv_x = 0.0f, float uv_y = 0.0f,
                   bool diagonal_midpoint = false);

private:
    [[nodiscard]] Color vertex_color(const std::array<Color, 4>& corners, const Color& lower,
                                     const Color& upper, float lower_t, float upper_t,
                                     float x, float y, float z, bool diagonal_midpoint) const;
    [[nodiscard]] bool all_edges_blend_merged() const;
    void warn(const char* code, std::string message);

    const GridMaps& maps_;
    const CellConfig& config_;
    CellContext ctx_;
    CellGeometry& out_;
    bool floor_mode_ = true;
};

// --- Primitives ---
// Each primitive assumes the builder's context is rotated so the feature sits
// at logical corner A (or edge AB) and emits triangles through add_point.

void add_full_floor(CellBuilder& b);

struct OuterCornerOptions {
    bool floor_below = true;
    bool floor_above = true;
    bool flatten = false;
    std::optional<float> bottom_height; // flatten level; default min(by, cy)
};
void add_outer_corner(CellBuilder& b, const OuterCornerOptions& opt = {});

struct EdgeOptions {
    bool floor_below = true;
    bool floor_above = true;
    float a_x = 0.0f; // upper floor span along AB
    float b_x = 1.0f;
};
void add_edge(CellBuilder& b, const EdgeOptions& opt = {});

struct InnerCornerOptions {
    bool full_upper_floor = true;
    bool flatten = false;
    std::optional<float> top_height; // flatten level; default min(by, cy)
    bool bd_floor = false;           // strip at C level towards a raised BD edge
    bool cd_floor = false;           // strip at B level towards a raised CD edge
};
void add_inner_corner(CellBuilder& b, const InnerCornerOptions& opt = {});

struct DiagonalFloorOptions {
    float b_y = 0.0f;
    float c_y = 0.0f;
    bool a_cliff = false; // A end sits on top of a cliff
    bool d_cliff = false;
};
void add_diagonal_floor(CellBuilder& b, const DiagonalFloorOptions& opt);

// add_center_floor fills the diamond between the four edge midpoints at a
// single height.
void add_center_floor(CellBuilder& b, float height);

// --- Case dispatcher ---

enum class CellCase {
    FullFloor,
    SingleWall,
    OuterCorner,
    Edge,
    EdgeOuterA,
    EdgeOuterB,
    InnerCorner,
    InnerCornerEdgeCD,
    InnerCornerEdgeBD,
    DoubleInner,
    DoubleOuter,
    InnerOuterDiagonal,
    DoubleInnerAsymmetric,
    Terrace,
};

[[nodiscard]] const char* case_name(CellCase c);

struct CaseMatch {
    CellCase kind = CellCase::FullFloor;
    int rotation = 0;
};

// classify_cell picks the first case (in priority order) that matches at any
// rotation; among matching rotations the one whose (ay, by, dy, cy) tuple is
// greatest wins, so rotating the input rotates the answer.
[[nodiscard]] CaseMatch classify_cell(const std::array<float, 4>& heights, float merge_threshold);

// generate_cell appends the geometry of one cell to out.
CaseMatch generate_cell(const GridMaps& maps, const CellConfig& config, int cell_x, int cell_z,
                        CellGeometry& out);

// generate_cell for a prepared context (tests and callers that bring their
// own heights).
CaseMatch generate_cell(const GridMaps& maps, const CellConfig& config, const CellContext& ctx,
                        CellGeometry& out);

// --- Validation ---

struct WatertightResult {
    bool watertight = true;
    std::vector<std::pair<Vec3, Vec3>> open_edges;
};

// validate_watertight reports triangle edges used exactly once that do not
// lie on the cell perimeter.
[[nodiscard]] WatertightResult validate_watertight(const CellGeometry& geo, int cell_x, int cell_z,
                                                   Vec2 cell_size);

} // namespace terratools::marching
